#include <apfShape.h>
#include "basis.hpp"
#include "macros.hpp"

namespace stvk {

Basis::Basis(apf::FieldShape* shape) {
  m_shape = shape;
}

void Basis::evaluate(
    apf::MeshElement* me,
    apf::Vector3 const& iota,
    bool with_grads) {
  apf::getBF(m_shape, me, iota, m_basis);
  // boundary elements carry no gradient information
  m_has_grads = with_grads;
  if (with_grads) apf::getGradBF(m_shape, me, iota, m_grad_basis);
}

double Basis::val(int n) const {
  return m_basis[n];
}

double Basis::grad(int n, int dim) const {
  DEBUG_ASSERT(m_has_grads);
  return m_grad_basis[n][dim];
}

}
