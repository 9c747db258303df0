#include "constitutive.hpp"
#include "control.hpp"
#include "defines.hpp"
#include "elasticity.hpp"
#include "element.hpp"
#include "fields.hpp"
#include "kinematics.hpp"
#include "macros.hpp"
#include "material_params.hpp"
#include "variant.hpp"

namespace stvk {

template <typename T>
Elasticity<T>::Elasticity(int variant, int ndims) {
  ALWAYS_ASSERT(variant >= 0 && variant < NUM_VARIANTS);
  ALWAYS_ASSERT(ndims == 2 || ndims == 3);
  m_variant = variant;
  this->m_name = "displacement";
  this->m_num_dims = ndims;
}

template <typename T>
Elasticity<T>::~Elasticity() {
}

static bool has_material(Element const& elem) {
  return elem.has_field(YOUNGS_MODULUS) && elem.has_field(POISSONS_RATIO);
}

template <typename T>
void Elasticity<T>::evaluate_internal(
    IntegrationPoint const& ip,
    double t) {

  // gather information from this class
  Element const& elem = *(this->m_elem);
  int const ndims = this->m_num_dims;
  int const nnodes = this->m_num_nodes;

  ALWAYS_ASSERT_VERBOSE(!elem.is_boundary(),
      "material fields need an element of the problem dimension");

  // gather material properties
  double const young = elem.scalar(YOUNGS_MODULUS, ip, t);
  double const poisson = elem.scalar(POISSONS_RATIO, ip, t);
  int const status = check_material_params(young, poisson);
  if (status != VALID_MATERIAL) {
    fail("invalid material (E = %g, nu = %g): %s",
        young, poisson, material_status_name(status));
  }

  // compute kinematic quantities
  Tensor<T> const grad_u = this->grad_vector_u();
  Deformation<T> const d = compute_deformation(grad_u);

  // compute stress measures
  T const E = young;
  T const nu = poisson;
  Lame<T> const lame = compute_lame(E, nu, m_variant);
  Tensor<T> const S = compute_pk2(lame, d.E);
  Tensor<T> const P = d.F * S;

  m_F = d.F;
  m_E = d.E;
  m_S = S;
  m_cauchy = compute_cauchy(d.F, S);
  m_has_stress = true;

  // compute the internal force residual
  for (int n = 0; n < nnodes; ++n) {
    for (int i = 0; i < ndims; ++i) {
      for (int j = 0; j < ndims; ++j) {
        double const dbasis_dx = this->dbasis(n, j);
        this->R_nodal(n, i) += P(i, j) * dbasis_dx;
      }
    }
  }

}

template <typename T>
void Elasticity<T>::evaluate_load(
    int field,
    IntegrationPoint const& ip,
    double t) {
  Element const& elem = *(this->m_elem);
  int const ndims = this->m_num_dims;
  int const nnodes = this->m_num_nodes;
  Vector<double> const b = elem.vector(field, ip, t);
  for (int n = 0; n < nnodes; ++n) {
    double const basis = this->basis(n);
    for (int i = 0; i < ndims; ++i) {
      this->R_nodal(n, i) -= b(i) * basis;
    }
  }
}

template <typename T>
void Elasticity<T>::evaluate(IntegrationPoint const& ip, double t) {

  Element const& elem = *(this->m_elem);
  m_has_stress = false;

  // internal forces
  if (has_material(elem)) {
    evaluate_internal(ip, t);
  }

  // external forces - volume load
  if (elem.has_field(DISPLACEMENT_LOAD)) {
    evaluate_load(DISPLACEMENT_LOAD, ip, t);
  }

  // external forces - surface traction force
  if (elem.has_field(DISPLACEMENT_TRACTION_FORCE)) {
    evaluate_load(DISPLACEMENT_TRACTION_FORCE, ip, t);
  }

}

template class Elasticity<double>;
template class Elasticity<FADT>;

}
