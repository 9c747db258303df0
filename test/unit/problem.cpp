#include <gtest/gtest.h>
#include <Teuchos_Array.hpp>
#include <element.hpp>
#include <evaluations.hpp>
#include <problem.hpp>
#include <variant.hpp>

using namespace stvk;

static Teuchos::Array<double> to_array(std::vector<double> const& v) {
  return Teuchos::Array<double>(v);
}

TEST(problem, default_dims) {
  Problem generic(GENERIC_3D);
  Problem plane(PLANE_STRESS);
  EXPECT_EQ(generic.variant(), GENERIC_3D);
  EXPECT_EQ(generic.num_dims(), 3);
  EXPECT_EQ(plane.variant(), PLANE_STRESS);
  EXPECT_EQ(plane.num_dims(), 2);
  EXPECT_EQ(plane.num_elems(), 0);
}

TEST(problem, explicit_dims_and_elems) {
  Array2D<double> const coords = {{0., 0.}, {1., 0.}, {0., 1.}};
  Array1D<RCP<Element>> elems;
  elems.push_back(rcp(new Element(apf::Mesh::TRIANGLE, coords)));
  elems.push_back(rcp(new Element(apf::Mesh::TRIANGLE, coords)));
  Problem problem(GENERIC_3D, 2, elems);
  EXPECT_EQ(problem.variant(), GENERIC_3D);
  EXPECT_EQ(problem.num_dims(), 2);
  EXPECT_EQ(problem.num_elems(), 2);
  EXPECT_EQ(problem.elem(1), elems[1]);
  EXPECT_EQ(problem.elem_name(0), "");
  Array2D<double> const edge_coords = {{0., 0.}, {1., 0.}};
  RCP<Element> edge = rcp(new Element(apf::Mesh::EDGE, edge_coords));
  problem.add_elem(edge, "bottom");
  EXPECT_EQ(problem.num_elems(), 3);
  EXPECT_EQ(problem.elem_name(2), "bottom");
}

TEST(problem, create_from_params) {
  ParameterList params;
  ParameterList& problem_params = params.sublist("problem");
  problem_params.set<std::string>("variant", "plane stress");
  problem_params.set<int>("quadrature order", 1);
  ParameterList& elems = params.sublist("elements");
  ParameterList& quad = elems.sublist("quad");
  quad.set<std::string>("type", "quad");
  quad.set<Teuchos::Array<double>>("coords",
      to_array({0., 0., 1., 0., 1., 1., 0., 1.}));
  ParameterList& quad_fields = quad.sublist("fields");
  quad_fields.sublist("youngs modulus").set("constant", to_array({1000.}));
  quad_fields.sublist("poissons ratio").set("constant", to_array({0.25}));
  quad_fields.sublist("displacement").set("nodal",
      to_array({0., 0., 0.01, 0., 0.01, 0., 0., 0.}));
  ParameterList& edge = elems.sublist("right");
  edge.set<std::string>("type", "edge");
  edge.set<Teuchos::Array<double>>("coords", to_array({1., 0., 1., 1.}));
  ParameterList& edge_fields = edge.sublist("fields");
  edge_fields.sublist("displacement traction force").set("constant",
      to_array({10., 0.}));
  RCP<Problem> problem = create_problem(params);
  EXPECT_EQ(get_q_order(params), 1);
  EXPECT_EQ(problem->variant(), PLANE_STRESS);
  EXPECT_EQ(problem->num_dims(), 2);
  ASSERT_EQ(problem->num_elems(), 2);
  EXPECT_EQ(problem->elem_name(0), "quad");
  EXPECT_EQ(problem->elem_name(1), "right");
  EXPECT_EQ(problem->elem(0)->num_nodes(), 4);
  EXPECT_EQ(problem->elem(0)->q_order(), 1);
  EXPECT_TRUE(problem->elem(1)->is_boundary());
  Array1D<EVector> const R = evaluate_elems(*problem, 0.);
  ASSERT_EQ(R.size(), 2u);
  EXPECT_NEAR(R[1](0), -5., 1.e-12);
  EXPECT_NEAR(R[1](2), -5., 1.e-12);
  int const ip = 0;
  IPResult const result = evaluate_ip(*problem, *(problem->elem(0)),
      problem->elem(0)->ip(ip), 0.);
  EXPECT_NEAR(result.E(0, 0), 0.01005, 1.e-9);
}

TEST(problem, create_without_elements) {
  ParameterList params;
  params.sublist("problem").set<std::string>("variant", "3D");
  RCP<Problem> problem = create_problem(params);
  EXPECT_EQ(problem->variant(), GENERIC_3D);
  EXPECT_EQ(problem->num_dims(), 3);
  EXPECT_EQ(problem->num_elems(), 0);
  EXPECT_EQ(get_q_order(params), 2);
}

TEST(problem_death_test, elem_dimension_mismatch) {
  Problem problem(GENERIC_3D);
  Array2D<double> const coords = {{0., 0.}, {1., 0.}, {0., 1.}};
  RCP<Element> tri = rcp(new Element(apf::Mesh::TRIANGLE, coords));
  EXPECT_DEATH(problem.add_elem(tri), "space_dims");
}

TEST(problem_death_test, unsupported_dims) {
  EXPECT_DEATH(Problem problem(PLANE_STRESS, 1),
      "unsupported number of dimensions: 1");
}

TEST(problem_death_test, unknown_variant) {
  ParameterList params;
  params.sublist("problem").set<std::string>("variant", "axisymmetric");
  EXPECT_DEATH(create_problem(params), "unknown problem variant: axisymmetric");
}
