#include <gtest/gtest.h>
#include <variant.hpp>

using namespace stvk;

TEST(variant, names) {
  EXPECT_EQ(variant_name(GENERIC_3D), "3D");
  EXPECT_EQ(variant_name(PLANE_STRESS), "plane stress");
  EXPECT_EQ(get_variant("3D"), GENERIC_3D);
  EXPECT_EQ(get_variant("plane stress"), PLANE_STRESS);
}

TEST(variant, default_dims) {
  EXPECT_EQ(default_num_dims(GENERIC_3D), 3);
  EXPECT_EQ(default_num_dims(PLANE_STRESS), 2);
}

TEST(variant, lambda_correction_table) {
  double const lambda = 3.;
  double const mu = 2.;
  LambdaCorrection<double> const generic = get_lambda_correction<double>(GENERIC_3D);
  LambdaCorrection<double> const plane = get_lambda_correction<double>(PLANE_STRESS);
  EXPECT_EQ(generic(lambda, mu), 3.);
  EXPECT_DOUBLE_EQ(plane(lambda, mu), 12. / 7.);
}

TEST(variant_death_test, unknown_name) {
  EXPECT_DEATH(get_variant("plane strain"),
      "unknown problem variant: plane strain");
}

TEST(variant_death_test, unknown_index) {
  EXPECT_DEATH(default_num_dims(NUM_VARIANTS), "unknown problem variant");
}
