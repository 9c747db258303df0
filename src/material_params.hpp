#pragma once

//! \file material_params.hpp
//! \brief Helper methods for material parameters

namespace stvk {

//! \brief The classification of an elastic modulus / Poisson's ratio pair
enum MaterialStatus {
  VALID_MATERIAL = 0,
  NONPOSITIVE_MODULUS = 1,
  POISSON_OUT_OF_RANGE = 2
};

//! \brief Compute the shear modulus
//! \param E The elastic modulus
//! \param nu Poisson's ratio
template <typename T>
T compute_mu(T const& E, T const& nu) {
  return E / (2. * (1. + nu));
}

//! \brief Compute lambda
//! \param E The elastic modulus
//! \param nu Poisson's ratio
template <typename T>
T compute_lambda(T const& E, T const& nu) {
  return E*nu/((1.+nu)*(1.-2.*nu));
}

//! \brief Reduce the 3D lambda for a state of plane stress
//! \param lambda The 3D Lame parameter
//! \param mu The shear modulus
template <typename T>
T plane_stress_lambda(T const& lambda, T const& mu) {
  return 2.*lambda*mu/(lambda + 2.*mu);
}

//! \brief Classify an elastic modulus / Poisson's ratio pair
//! \param E The elastic modulus
//! \param nu Poisson's ratio
//! \details Valid pairs satisfy E > 0 and -1 < nu < 1/2, which keeps
//! mu > 0 and lambda + 2 mu > 0
inline int check_material_params(double E, double nu) {
  if (!(E > 0.)) return NONPOSITIVE_MODULUS;
  if (!(nu > -1. && nu < 0.5)) return POISSON_OUT_OF_RANGE;
  return VALID_MATERIAL;
}

//! \brief A human readable reason for a material classification
//! \param status The result of check_material_params
inline const char* material_status_name(int status) {
  if (status == NONPOSITIVE_MODULUS) return "non-positive elastic modulus";
  if (status == POISSON_OUT_OF_RANGE) return "Poisson's ratio outside (-1, 0.5)";
  return "valid";
}

}
