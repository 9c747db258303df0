#include "control.hpp"
#include "material_params.hpp"
#include "variant.hpp"

namespace stvk {

template <typename T>
static T unmodified_lambda(T const& lambda, T const&) {
  return lambda;
}

template <typename T>
static T reduced_lambda(T const& lambda, T const& mu) {
  return plane_stress_lambda(lambda, mu);
}

template <typename T>
LambdaCorrection<T> get_lambda_correction(int variant) {
  static LambdaCorrection<T> const table[NUM_VARIANTS] = {
    &unmodified_lambda<T>,
    &reduced_lambda<T>
  };
  if (variant < 0 || variant >= NUM_VARIANTS) {
    fail("unknown problem variant: %d", variant);
  }
  return table[variant];
}

static char const* const variant_names[NUM_VARIANTS] = {
  "3D",
  "plane stress"
};

static int const variant_dims[NUM_VARIANTS] = {3, 2};

int default_num_dims(int variant) {
  if (variant < 0 || variant >= NUM_VARIANTS) {
    fail("unknown problem variant: %d", variant);
  }
  return variant_dims[variant];
}

std::string variant_name(int variant) {
  if (variant < 0 || variant >= NUM_VARIANTS) {
    fail("unknown problem variant: %d", variant);
  }
  return variant_names[variant];
}

int get_variant(std::string const& name) {
  for (int v = 0; v < NUM_VARIANTS; ++v) {
    if (name == variant_names[v]) return v;
  }
  fail("unknown problem variant: %s", name.c_str());
}

template LambdaCorrection<double> get_lambda_correction<double>(int);
template LambdaCorrection<FADT> get_lambda_correction<FADT>(int);

}
