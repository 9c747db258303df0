#pragma once

//! \file variant.hpp
//! \brief Elasticity problem variants and their Lame corrections

#include <string>
#include "defines.hpp"

namespace stvk {

//! \brief The elasticity problem variants
enum ProblemVariant {
  GENERIC_3D = 0,
  PLANE_STRESS = 1,
  NUM_VARIANTS = 2
};

//! \brief A rule mapping the 3D (lambda, mu) pair to the lambda
//! used by a problem variant
template <typename T>
using LambdaCorrection = T (*)(T const& lambda, T const& mu);

//! \brief Get the lambda correction rule for a problem variant
//! \param variant The problem variant of interest
template <typename T>
LambdaCorrection<T> get_lambda_correction(int variant);

//! \brief Get the default number of spatial dimensions of a variant
//! \param variant The problem variant of interest
int default_num_dims(int variant);

//! \brief Get the input name of a problem variant
//! \param variant The problem variant of interest
std::string variant_name(int variant);

//! \brief Get a problem variant from its input name
//! \param name The input name ("3D" or "plane stress")
int get_variant(std::string const& name);

}
