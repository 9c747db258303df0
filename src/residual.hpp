#pragma once

//! \file residual.hpp
//! \brief The integration point residual interface

#include <string>
#include "arrays.hpp"
#include "basis.hpp"
#include "defines.hpp"

namespace stvk {

//! \cond
//  forward declarations
class Element;
class IntegrationPoint;
class Problem;
//! \endcond

//! \brief The integration point residual interface
//! \tparam T The underlying scalar type used for evaluations
//! \details This object evaluates the residual contribution of one
//! element at one integration point. The displacement is gathered at
//! the element nodes, either from the element's displacement field or
//! from a supplied variation, then interpolated to the point.
template <typename T>
class Residual {

  public:

    //! \brief The residual constructor
    Residual();

    //! \brief The residual destructor
    virtual ~Residual();

    //! \brief The name of the residual / unknown field
    std::string const& name() const { return m_name; }

    //! \brief The number of spatial dimensions
    int num_dims() const { return m_num_dims; }

    //! \brief The number of nodes in the current element
    int num_nodes() const { return m_num_nodes; }

    //! \brief The number of dofs in the current element
    int num_dofs() const { return m_num_dofs; }

    //! \brief Set element data on element input
    //! \param elem The current element to operate on
    void set_elem(Element const& elem);

    //! \brief Gather the nodal displacement from the element field
    //! \param t The current time
    //! \details Gathers zeros if the element has no displacement field
    void gather(double t);

    //! \brief Gather the nodal displacement from a supplied variation
    //! \param u The node-major nodal displacement (num_dofs entries)
    void gather(EVector const& u);

    //! \brief Zero the integration point residual
    void zero_residual();

    //! \brief Seed the nodal displacement as derivative quantities
    //! \details Only performs an operation if this class has been
    //! templated on FADT
    void seed_wrt_u();

    //! \brief Unseed the nodal displacement as derivative quantities
    void unseed_wrt_u();

    //! \brief Interpolate the nodal values to an integration point
    //! \param ip The integration point
    //! \details This evaluates the basis (and its gradients when the
    //! element is not a boundary element). This should be called after
    //! gather + seed have been called appropriately
    void interpolate(IntegrationPoint const& ip);

    //! \brief Evaluate the residual at an integration point
    //! \param ip The integration point
    //! \param t The current time
    virtual void evaluate(IntegrationPoint const& ip, double t) = 0;

    //! \brief Reset element-specific data after processing an element
    void unset_elem();

    //! \brief The nodal values of the displacement
    //! \param node The node index
    //! \param eq The displacement component
    T const& u_nodal(int node, int eq) const {
      return m_u_nodal[node][eq];
    }

    //! \brief The nodal residual values
    //! \param node The node index
    //! \param eq The displacement component
    T& R_nodal(int node, int eq) {
      return m_R_nodal[node][eq];
    }

    //! \brief The basis function of a node at the current point
    //! \param n The node index
    double basis(int n) const { return m_basis.val(n); }

    //! \brief The basis function gradient of a node at the current point
    //! \param n The node index
    //! \param dim The derivative axis
    double dbasis(int n, int dim) const { return m_basis.grad(n, dim); }

    //! \brief Get the displacement gradient at the current integration point
    Tensor<T> grad_vector_u() const;

    //! \brief Gather the flattened residual values R
    EVector eigen_residual() const;

    //! \brief Gather the Jacobian matrix dR / du
    //! \details Returns an empty matrix unless templated on FADT
    EMatrix eigen_jacobian() const;

  private:

    int dx_idx(int node, int eq) const;

  protected:

    //! \cond

    std::string m_name = "displacement";

    int m_num_dims = -1;
    int m_num_nodes = -1;
    int m_num_dofs = -1;

    Element const* m_elem = nullptr;

    Array2D<T> m_u_nodal;
    Array2D<T> m_R_nodal;

    Array2D<T> m_grad_u;

    Basis m_basis;

    //! \endcond

};

//! \brief Create a residual for a problem
//! \tparam T The underlying scalar type used for evaluations
//! \param problem The problem whose variant / dimension to use
template <typename T>
RCP<Residual<T>> create_residual(Problem const& problem);

}
