#include <gtest/gtest.h>
#include <fields.hpp>

using namespace stvk;

TEST(fields, names) {
  EXPECT_EQ(field_name(DISPLACEMENT), "displacement");
  EXPECT_EQ(field_name(YOUNGS_MODULUS), "youngs modulus");
  EXPECT_EQ(field_name(POISSONS_RATIO), "poissons ratio");
  EXPECT_EQ(field_name(DISPLACEMENT_LOAD), "displacement load");
  EXPECT_EQ(field_name(DISPLACEMENT_TRACTION_FORCE), "displacement traction force");
  for (int f = 0; f < NUM_FIELDS; ++f) {
    EXPECT_EQ(get_field(field_name(f)), f);
  }
}

TEST(fields, var_types) {
  EXPECT_EQ(get_var_type(DISPLACEMENT), VECTOR);
  EXPECT_EQ(get_var_type(YOUNGS_MODULUS), SCALAR);
  EXPECT_EQ(get_var_type(POISSONS_RATIO), SCALAR);
  EXPECT_EQ(get_var_type(DISPLACEMENT_LOAD), VECTOR);
  EXPECT_EQ(get_var_type(DISPLACEMENT_TRACTION_FORCE), VECTOR);
  EXPECT_EQ(get_num_eqs(SCALAR, 3), 1);
  EXPECT_EQ(get_num_eqs(VECTOR, 2), 2);
  EXPECT_EQ(get_num_eqs(VECTOR, 3), 3);
}

TEST(fields, kinds) {
  EXPECT_EQ(get_field_kind("constant"), CONSTANT);
  EXPECT_EQ(get_field_kind("nodal"), NODAL);
  EXPECT_EQ(get_field_kind("ip"), IP);
  EXPECT_EQ(get_field_kind("expression"), EXPRESSION);
}

TEST(fields, construction) {
  Field const c = constant_field({0., -9.81});
  EXPECT_EQ(c.kind, CONSTANT);
  EXPECT_EQ(c.num_comps, 2);
  EXPECT_EQ(c.values.size(), 1u);
  Field const n = nodal_field({{0.}, {1.}, {2.}});
  EXPECT_EQ(n.kind, NODAL);
  EXPECT_EQ(n.num_comps, 1);
  EXPECT_EQ(n.values.size(), 3u);
  Field const e = expression_field({"x", "2.0*t", "0.0"});
  EXPECT_EQ(e.kind, EXPRESSION);
  EXPECT_EQ(e.num_comps, 3);
}

TEST(fields_death_test, unknown_name) {
  EXPECT_DEATH(get_field("temperature"), "unknown field: temperature");
}

TEST(fields_death_test, unknown_kind) {
  EXPECT_DEATH(get_field_kind("table"), "unknown field kind: table");
}
