#pragma once

//! \file kinematics.hpp
//! \brief Finite strain kinematic quantities

#include "defines.hpp"

namespace stvk {

//! \brief The kinematic state at a material point
//! \tparam T The underlying scalar type used for evaluations
template <typename T>
struct Deformation {
  //! \brief The deformation gradient F = I + grad(u)
  Tensor<T> F;
  //! \brief The Green-Lagrange strain E = 1/2 (F^T F - I)
  Tensor<T> E;
};

//! \brief Compute the deformation gradient
//! \param grad_u The displacement gradient
template <typename T>
Tensor<T> compute_F(Tensor<T> const& grad_u) {
  int const ndims = grad_u.get_dimension();
  Tensor<T> const I = minitensor::eye<T>(ndims);
  return I + grad_u;
}

//! \brief Compute the Green-Lagrange strain
//! \param F The deformation gradient
template <typename T>
Tensor<T> compute_green_lagrange(Tensor<T> const& F) {
  int const ndims = F.get_dimension();
  Tensor<T> const I = minitensor::eye<T>(ndims);
  return 0.5 * (minitensor::transpose(F) * F - I);
}

//! \brief Compute the deformation gradient and Green-Lagrange strain
//! \param grad_u The displacement gradient
template <typename T>
Deformation<T> compute_deformation(Tensor<T> const& grad_u) {
  Deformation<T> d;
  d.F = compute_F(grad_u);
  d.E = compute_green_lagrange(d.F);
  return d;
}

}
