#pragma once

//! \file evaluations.hpp
//! \brief Residual evaluations at integration points and over elements

#include "arrays.hpp"
#include "defines.hpp"

namespace stvk {

//! \cond
// forward declarations
class Element;
class IntegrationPoint;
class Problem;
//! \endcond

//! \brief The outcome of an integration point residual evaluation
struct IPResult {
  //! \brief The node-major residual, R[n * ndims + i]
  EVector R;
  //! \brief Was the internal force term active (material present)
  bool has_stress = false;
  //! \brief The deformation gradient (if has_stress)
  Tensor<double> F;
  //! \brief The Green-Lagrange strain (if has_stress)
  Tensor<double> E;
  //! \brief The second Piola-Kirchhoff stress (if has_stress)
  Tensor<double> S;
  //! \brief The Cauchy stress (if has_stress)
  Tensor<double> cauchy;
};

//! \brief Evaluate the residual at an integration point
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param ip The integration point of interest
//! \param t The current time
//! \details The displacement comes from the element's displacement field
IPResult evaluate_ip(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t);

//! \brief Evaluate the residual at an integration point for a variation
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param ip The integration point of interest
//! \param t The current time
//! \param u The node-major nodal displacement used in place of the
//! element's displacement field
IPResult evaluate_ip(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t,
    EVector const& u);

//! \brief Evaluate the residual Jacobian dR/du at an integration point
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param ip The integration point of interest
//! \param t The current time
EMatrix evaluate_ip_jacobian(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t);

//! \brief Evaluate the residual Jacobian dR/du at an integration point
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param ip The integration point of interest
//! \param t The current time
//! \param u The node-major nodal displacement to linearize about
EMatrix evaluate_ip_jacobian(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t,
    EVector const& u);

//! \brief Integrate the residual over an element
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param t The current time
EVector integrate_residual(
    Problem const& problem,
    Element const& elem,
    double t);

//! \brief Integrate the residual over an element for a variation
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param t The current time
//! \param u The node-major nodal displacement
EVector integrate_residual(
    Problem const& problem,
    Element const& elem,
    double t,
    EVector const& u);

//! \brief Integrate the residual Jacobian over an element
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param t The current time
EMatrix integrate_jacobian(
    Problem const& problem,
    Element const& elem,
    double t);

//! \brief Integrate the residual Jacobian over an element
//! \param problem The problem the element belongs to
//! \param elem The element of interest
//! \param t The current time
//! \param u The node-major nodal displacement to linearize about
EMatrix integrate_jacobian(
    Problem const& problem,
    Element const& elem,
    double t,
    EVector const& u);

//! \brief Integrate the residual over every element of a problem
//! \param problem The problem of interest
//! \param t The current time
//! \details The element vectors are returned unassembled
Array1D<EVector> evaluate_elems(Problem const& problem, double t);

//! \brief Persist the strain / stress of an evaluation at its point
//! \param ip The integration point that was evaluated
//! \param result The result of the evaluation
//! \details Writes "gl strain" and "cauchy stress", overwriting any
//! previous values. Does nothing if the internal force was inactive.
void store_state(IntegrationPoint& ip, IPResult const& result);

}
