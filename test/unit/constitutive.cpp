#include <cmath>
#include <gtest/gtest.h>
#include <constitutive.hpp>
#include <kinematics.hpp>
#include <material_params.hpp>
#include <variant.hpp>

using namespace stvk;

TEST(material_params, lame_parameters) {
  double const E = 210000.;
  double const nu = 0.3;
  EXPECT_DOUBLE_EQ(compute_mu(E, nu), 210000. / 2.6);
  EXPECT_DOUBLE_EQ(compute_lambda(E, nu), 210000. * 0.3 / (1.3 * 0.4));
}

TEST(material_params, check) {
  EXPECT_EQ(check_material_params(210000., 0.3), VALID_MATERIAL);
  EXPECT_EQ(check_material_params(1., -0.99), VALID_MATERIAL);
  EXPECT_EQ(check_material_params(0., 0.3), NONPOSITIVE_MODULUS);
  EXPECT_EQ(check_material_params(-1., 0.3), NONPOSITIVE_MODULUS);
  EXPECT_EQ(check_material_params(1., 0.5), POISSON_OUT_OF_RANGE);
  EXPECT_EQ(check_material_params(1., -1.), POISSON_OUT_OF_RANGE);
  EXPECT_EQ(check_material_params(1., std::nan("")), POISSON_OUT_OF_RANGE);
}

TEST(constitutive, plane_stress_lambda) {
  double const E = 210000.;
  double const nu = 0.3;
  double const mu = compute_mu(E, nu);
  double const lambda = compute_lambda(E, nu);
  Lame<double> const lame = compute_lame(E, nu, PLANE_STRESS);
  EXPECT_EQ(lame.mu, mu);
  EXPECT_EQ(lame.lambda, 2. * lambda * mu / (lambda + 2. * mu));
  EXPECT_NEAR(lame.lambda, E * nu / (1. - nu * nu), 1.e-8);
}

TEST(constitutive, generic_3D_lambda) {
  double const E = 210000.;
  double const nu = 0.3;
  Lame<double> const lame = compute_lame(E, nu, GENERIC_3D);
  EXPECT_EQ(lame.mu, compute_mu(E, nu));
  EXPECT_EQ(lame.lambda, compute_lambda(E, nu));
}

TEST(constitutive, pk2_uniaxial_plane_stress) {
  double const E = 1000.;
  double const nu = 0.25;
  Tensor<double> grad_u = minitensor::zero<double>(2);
  grad_u(0, 0) = 0.01;
  Tensor<double> const GL = compute_deformation(grad_u).E;
  Tensor<double> const S = compute_pk2(E, nu, GL, PLANE_STRESS);
  double const lambda = 800. / 3.;
  double const mu = 400.;
  EXPECT_NEAR(S(0, 0), (lambda + 2. * mu) * GL(0, 0), 1.e-10);
  EXPECT_NEAR(S(1, 1), lambda * GL(0, 0), 1.e-10);
  EXPECT_NEAR(S(0, 1), 0., 1.e-14);
  EXPECT_NEAR(S(1, 0), 0., 1.e-14);
}

TEST(constitutive, pk2_zero_strain) {
  for (int v = 0; v < NUM_VARIANTS; ++v) {
    int const ndims = default_num_dims(v);
    Tensor<double> const GL = minitensor::zero<double>(ndims);
    Tensor<double> const S = compute_pk2(210000., 0.3, GL, v);
    for (int i = 0; i < ndims; ++i) {
      for (int j = 0; j < ndims; ++j) {
        EXPECT_EQ(S(i, j), 0.);
      }
    }
  }
}

TEST(constitutive, pk2_symmetry) {
  Tensor<double> grad_u(3);
  double vals[9] = {0.02, 0.01, -0.03, 0.04, -0.01, 0.02, 0.005, 0.03, 0.01};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      grad_u(i, j) = vals[i * 3 + j];
    }
  }
  Tensor<double> const GL = compute_deformation(grad_u).E;
  Tensor<double> const S = compute_pk2(210000., 0.3, GL, GENERIC_3D);
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      EXPECT_NEAR(S(i, j), S(j, i), 1.e-9);
    }
  }
}

TEST(constitutive, cauchy_at_identity_is_pk2) {
  Tensor<double> const F = minitensor::eye<double>(2);
  Tensor<double> S(2);
  S(0, 0) = 3.;
  S(0, 1) = 1.;
  S(1, 0) = 1.;
  S(1, 1) = -2.;
  Tensor<double> const sigma = compute_cauchy(F, S);
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 2; ++j) {
      EXPECT_DOUBLE_EQ(sigma(i, j), S(i, j));
    }
  }
}

TEST(constitutive, cauchy_uniaxial_stretch) {
  Tensor<double> F = minitensor::eye<double>(2);
  F(0, 0) = 2.;
  Tensor<double> S = minitensor::zero<double>(2);
  S(0, 0) = 1.;
  S(1, 1) = 4.;
  Tensor<double> const sigma = compute_cauchy(F, S);
  EXPECT_DOUBLE_EQ(sigma(0, 0), 2.);
  EXPECT_DOUBLE_EQ(sigma(1, 1), 2.);
  EXPECT_DOUBLE_EQ(sigma(0, 1), 0.);
}
