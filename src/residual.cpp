#include <algorithm>
#include <apfShape.h>
#include "control.hpp"
#include "defines.hpp"
#include "elasticity.hpp"
#include "element.hpp"
#include "fad.hpp"
#include "fields.hpp"
#include "macros.hpp"
#include "problem.hpp"
#include "residual.hpp"

namespace stvk {

template <typename T>
Residual<T>::Residual() :
  m_basis(apf::getLagrange(1)) {
}

template <typename T>
Residual<T>::~Residual() {
}

template <typename T>
int Residual<T>::dx_idx(int node, int eq) const {
  return node * m_num_dims + eq;
}

template <typename T>
Tensor<T> Residual<T>::grad_vector_u() const {
  Tensor<T> val(m_num_dims);
  for (int k = 0; k < m_num_dims; ++k) {
    for (int l = 0; l < m_num_dims; ++l) {
      val(k, l) = m_grad_u[k][l];
    }
  }
  return val;
}

template <typename T>
void Residual<T>::set_elem(Element const& elem) {

  ALWAYS_ASSERT_EQ(elem.space_dims(), m_num_dims);

  // set element-based information
  m_elem = &elem;
  m_num_nodes = elem.num_nodes();
  m_num_dofs = m_num_nodes * m_num_dims;

  // resize the nodal quantities
  resize(m_u_nodal, m_num_nodes, m_num_dims);
  resize(m_R_nodal, m_num_nodes, m_num_dims);

  // resize the interpolated value quantities
  resize(m_grad_u, m_num_dims, m_num_dims);

}

template <>
void Residual<double>::zero_residual() {
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      m_R_nodal[n][eq] = 0.;
    }
  }
}

template <>
void Residual<FADT>::zero_residual() {
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      m_R_nodal[n][eq] = 0.;
      for (int k = 0; k < nmax_derivs; ++k) {
        m_R_nodal[n][eq].fastAccessDx(k) = 0.;
      }
    }
  }
}

template <typename T>
void Residual<T>::gather(double t) {
  DEBUG_ASSERT(m_elem);
  if (!m_elem->has_field(DISPLACEMENT)) {
    for (int n = 0; n < m_num_nodes; ++n) {
      for (int eq = 0; eq < m_num_dims; ++eq) {
        m_u_nodal[n][eq] = 0.;
      }
    }
    return;
  }
  Array2D<double> const u_vals = m_elem->nodal_values(DISPLACEMENT, t);
  ALWAYS_ASSERT_EQ(int(u_vals.size()), m_num_nodes);
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      m_u_nodal[n][eq] = u_vals[n][eq];
    }
  }
}

template <typename T>
void Residual<T>::gather(EVector const& u) {
  DEBUG_ASSERT(m_elem);
  ALWAYS_ASSERT_EQ(int(u.size()), m_num_dofs);
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      m_u_nodal[n][eq] = u[dx_idx(n, eq)];
    }
  }
}

template <>
void Residual<double>::seed_wrt_u() {}

template <>
void Residual<FADT>::seed_wrt_u() {
  ALWAYS_ASSERT(m_num_dofs <= nmax_derivs);
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      int const dof = dx_idx(n, eq);
      m_u_nodal[n][eq].diff(dof, m_num_dofs);
    }
  }
}

template <>
void Residual<double>::unseed_wrt_u() {}

template <>
void Residual<FADT>::unseed_wrt_u() {
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      m_u_nodal[n][eq] = m_u_nodal[n][eq].val();
      for (int idx = 0; idx < nmax_derivs; ++idx) {
        m_u_nodal[n][eq].fastAccessDx(idx) = 0.;
        m_R_nodal[n][eq].fastAccessDx(idx) = 0.;
      }
    }
  }
}

template <typename T>
void Residual<T>::interpolate(IntegrationPoint const& ip) {

  // evaluate the shape functions at the current integration point
  bool const with_grads = !m_elem->is_boundary();
  m_basis.evaluate(m_elem->apf_elem(), ip.iota(), with_grads);

  // boundary elements carry no displacement gradient
  if (!with_grads) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      for (int d = 0; d < m_num_dims; ++d) {
        m_grad_u[eq][d] = 0.;
      }
    }
    return;
  }

  // interpolate the displacement gradient
  for (int eq = 0; eq < m_num_dims; ++eq) {
    for (int d = 0; d < m_num_dims; ++d) {
      m_grad_u[eq][d] = u_nodal(0, eq) * dbasis(0, d);
      for (int n = 1; n < m_num_nodes; ++n) {
        m_grad_u[eq][d] += u_nodal(n, eq) * dbasis(n, d);
      }
    }
  }

}

template <typename T>
EVector Residual<T>::eigen_residual() const {
  EVector R(m_num_dofs);
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int eq = 0; eq < m_num_dims; ++eq) {
      R[dx_idx(n, eq)] = val(m_R_nodal[n][eq]);
    }
  }
  return R;
}

template <>
EMatrix Residual<double>::eigen_jacobian() const {
  EMatrix empty;
  return empty;
}

template <>
EMatrix Residual<FADT>::eigen_jacobian() const {
  EMatrix J = EMatrix::Zero(m_num_dofs, m_num_dofs);
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int i_eq = 0; i_eq < m_num_dims; ++i_eq) {
      int const i_idx = dx_idx(n, i_eq);
      FADT const& R = m_R_nodal[n][i_eq];
      int const nderivs = std::min(num_derivs(R), m_num_dofs);
      for (int j = 0; j < nderivs; ++j) {
        J(i_idx, j) = dx(R, j);
      }
    }
  }
  return J;
}

template <typename T>
void Residual<T>::unset_elem() {
  m_elem = nullptr;
  m_num_nodes = -1;
  m_num_dofs = -1;
  m_u_nodal.resize(0);
  m_R_nodal.resize(0);
  m_grad_u.resize(0);
}

template <typename T>
RCP<Residual<T>> create_residual(Problem const& problem) {
  return rcp(new Elasticity<T>(problem.variant(), problem.num_dims()));
}

template class Residual<double>;
template class Residual<FADT>;

template RCP<Residual<double>> create_residual<double>(Problem const&);
template RCP<Residual<FADT>> create_residual<FADT>(Problem const&);

}
