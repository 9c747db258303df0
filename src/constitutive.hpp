#pragma once

//! \file constitutive.hpp
//! \brief The St. Venant-Kirchhoff stress response

#include "defines.hpp"
#include "material_params.hpp"
#include "variant.hpp"

namespace stvk {

//! \brief The Lame parameters of an isotropic material
//! \tparam T The underlying scalar type used for evaluations
template <typename T>
struct Lame {
  T lambda;
  T mu;
};

//! \brief Compute the Lame parameters used by a problem variant
//! \param E The elastic modulus
//! \param nu Poisson's ratio
//! \param variant The problem variant
//! \details The plane stress variant reduces lambda, the 3D variant
//! leaves it unmodified
template <typename T>
Lame<T> compute_lame(T const& E, T const& nu, int variant) {
  Lame<T> lame;
  lame.mu = compute_mu(E, nu);
  lame.lambda = compute_lambda(E, nu);
  LambdaCorrection<T> const correct = get_lambda_correction<T>(variant);
  lame.lambda = correct(lame.lambda, lame.mu);
  return lame;
}

//! \brief Compute the second Piola-Kirchhoff stress
//! \param lame The Lame parameters
//! \param E The Green-Lagrange strain
template <typename T>
Tensor<T> compute_pk2(Lame<T> const& lame, Tensor<T> const& E) {
  int const ndims = E.get_dimension();
  Tensor<T> const I = minitensor::eye<T>(ndims);
  return lame.lambda * minitensor::trace(E) * I + 2. * lame.mu * E;
}

//! \brief Compute the second Piola-Kirchhoff stress
//! \param young The elastic modulus
//! \param poisson Poisson's ratio
//! \param E The Green-Lagrange strain
//! \param variant The problem variant
template <typename T>
Tensor<T> compute_pk2(
    T const& young,
    T const& poisson,
    Tensor<T> const& E,
    int variant) {
  Lame<T> const lame = compute_lame(young, poisson, variant);
  return compute_pk2(lame, E);
}

//! \brief Push the second Piola-Kirchhoff stress forward to Cauchy stress
//! \param F The deformation gradient
//! \param S The second Piola-Kirchhoff stress
//! \details sigma = J^{-1} F S F^T with J = det(F)
template <typename T>
Tensor<T> compute_cauchy(Tensor<T> const& F, Tensor<T> const& S) {
  T const J = minitensor::det(F);
  T const J_inv = 1. / J;
  return J_inv * F * S * minitensor::transpose(F);
}

}
