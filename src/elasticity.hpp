#pragma once

//! \file elasticity.hpp
//! \brief The interface for finite strain elasticity residuals

#include "residual.hpp"

namespace stvk {

//! \brief The residual for St. Venant-Kirchhoff elasticity problems
//! \tparam T The underlying scalar type used for evaluations
//! \details This implements a concrete instance of the Residual base
//! class for the weak form of the balance of linear momentum in the
//! reference configuration,
//! R = int S : dE dV - int b . du dV - int t . du dA.
//! Each of the three terms is only active if the element carries the
//! fields it needs.
template <typename T>
class Elasticity : public Residual<T> {

  public:

    //! \brief The elasticity constructor
    //! \param variant The problem variant (see ProblemVariant)
    //! \param ndims The number of spatial dimensions
    Elasticity(int variant, int ndims);

    //! \brief The elasticity destructor
    ~Elasticity();

    //! \brief The problem variant
    int variant() const { return m_variant; }

    //! \brief Evaluate the residual at an integration point
    //! \param ip The integration point
    //! \param t The current time
    void evaluate(IntegrationPoint const& ip, double t);

    //! \brief Was the internal force term active in the last evaluation
    bool has_stress() const { return m_has_stress; }

    //! \brief The deformation gradient of the last evaluation
    Tensor<T> const& F() const { return m_F; }

    //! \brief The Green-Lagrange strain of the last evaluation
    Tensor<T> const& E() const { return m_E; }

    //! \brief The second Piola-Kirchhoff stress of the last evaluation
    Tensor<T> const& S() const { return m_S; }

    //! \brief The Cauchy stress of the last evaluation
    Tensor<T> const& cauchy() const { return m_cauchy; }

  private:

    void evaluate_internal(IntegrationPoint const& ip, double t);
    void evaluate_load(int field, IntegrationPoint const& ip, double t);

    int m_variant = -1;
    bool m_has_stress = false;

    Tensor<T> m_F;
    Tensor<T> m_E;
    Tensor<T> m_S;
    Tensor<T> m_cauchy;

};

}
