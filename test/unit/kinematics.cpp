#include <cmath>
#include <gtest/gtest.h>
#include <kinematics.hpp>

using namespace stvk;

static Tensor<double> rotation_2D(double theta) {
  Tensor<double> R(2);
  R(0, 0) = std::cos(theta);
  R(0, 1) = -std::sin(theta);
  R(1, 0) = std::sin(theta);
  R(1, 1) = std::cos(theta);
  return R;
}

static Tensor<double> rotation_3D(double theta) {
  Tensor<double> R = minitensor::eye<double>(3);
  R(0, 0) = std::cos(theta);
  R(0, 2) = std::sin(theta);
  R(2, 0) = -std::sin(theta);
  R(2, 2) = std::cos(theta);
  return R;
}

TEST(kinematics, zero_gradient_is_identity) {
  for (int ndims = 2; ndims <= 3; ++ndims) {
    Tensor<double> const grad_u = minitensor::zero<double>(ndims);
    Deformation<double> const d = compute_deformation(grad_u);
    for (int i = 0; i < ndims; ++i) {
      for (int j = 0; j < ndims; ++j) {
        EXPECT_EQ(d.F(i, j), (i == j) ? 1. : 0.);
        EXPECT_EQ(d.E(i, j), 0.);
      }
    }
  }
}

TEST(kinematics, uniaxial_strain) {
  Tensor<double> grad_u = minitensor::zero<double>(2);
  grad_u(0, 0) = 0.01;
  Deformation<double> const d = compute_deformation(grad_u);
  EXPECT_DOUBLE_EQ(d.F(0, 0), 1.01);
  EXPECT_DOUBLE_EQ(d.F(1, 1), 1.);
  EXPECT_NEAR(d.E(0, 0), 0.01005, 1.e-9);
  EXPECT_NEAR(d.E(0, 1), 0., 1.e-9);
  EXPECT_NEAR(d.E(1, 0), 0., 1.e-9);
  EXPECT_NEAR(d.E(1, 1), 0., 1.e-9);
}

TEST(kinematics, rigid_rotation_2D) {
  Tensor<double> const I = minitensor::eye<double>(2);
  Tensor<double> const grad_u = rotation_2D(0.3) - I;
  Tensor<double> const E = compute_deformation(grad_u).E;
  for (int i = 0; i < 2; ++i) {
    for (int j = 0; j < 2; ++j) {
      EXPECT_NEAR(E(i, j), 0., 1.e-14);
    }
  }
}

TEST(kinematics, rigid_rotation_3D) {
  Tensor<double> const I = minitensor::eye<double>(3);
  Tensor<double> const grad_u = rotation_3D(1.1) - I;
  Tensor<double> const E = compute_deformation(grad_u).E;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      EXPECT_NEAR(E(i, j), 0., 1.e-14);
    }
  }
}

TEST(kinematics, green_lagrange_symmetry) {
  Tensor<double> grad_u(3);
  double vals[9] = {0.1, -0.2, 0.05, 0.3, 0.02, -0.1, 0.07, 0.11, -0.04};
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      grad_u(i, j) = vals[i * 3 + j];
    }
  }
  Tensor<double> const E = compute_deformation(grad_u).E;
  for (int i = 0; i < 3; ++i) {
    for (int j = 0; j < 3; ++j) {
      EXPECT_NEAR(E(i, j), E(j, i), 1.e-15);
    }
  }
}
