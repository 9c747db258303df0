#pragma once

//! \file basis.hpp
//! \brief Basis function values and gradients at a point

#include <apf.h>

namespace stvk {

//! \brief Basis functions of an element evaluated at a single point
class Basis {
  public:
    Basis(apf::FieldShape* shape);
    void evaluate(
        apf::MeshElement* me,
        apf::Vector3 const& iota,
        bool with_grads = true);
    bool has_grads() const { return m_has_grads; }
    double val(int n) const;
    double grad(int n, int dim) const;
  protected:
    apf::FieldShape* m_shape = nullptr;
    bool m_has_grads = false;
    apf::NewArray<double> m_basis;
    apf::NewArray<apf::Vector3> m_grad_basis;
};

}
