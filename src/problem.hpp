#pragma once

//! \file problem.hpp
//! \brief An elasticity problem: a variant, a dimension and its elements

#include <string>
#include "arrays.hpp"
#include "defines.hpp"

namespace stvk {

//! \cond
// forward declarations
class Element;
//! \endcond

//! \brief An elasticity problem
//! \details The variant is fixed at construction. Elements are held
//! by reference counted pointers, so each one stays independently
//! addressable.
class Problem {

  public:

    //! \brief Construct a problem
    //! \param variant The problem variant (see ProblemVariant)
    //! \param ndims The number of spatial dimensions, or -1 to use the
    //! default of the variant
    //! \param elems The initial element collection
    Problem(
        int variant,
        int ndims = -1,
        Array1D<RCP<Element>> const& elems = Array1D<RCP<Element>>());

    //! \brief The problem variant
    int variant() const { return m_variant; }

    //! \brief The number of spatial dimensions
    int num_dims() const { return m_num_dims; }

    //! \brief The number of elements
    int num_elems() const { return int(m_elems.size()); }

    //! \brief An element of the problem
    //! \param i The element index
    RCP<Element> elem(int i) const { return m_elems[i]; }

    //! \brief The name of an element (empty if unnamed)
    //! \param i The element index
    std::string const& elem_name(int i) const { return m_elem_names[i]; }

    //! \brief Append an element to the problem
    //! \param elem The element, whose coordinates must match the
    //! problem dimension
    //! \param name An optional name for the element
    void add_elem(RCP<Element> elem, std::string const& name = "");

  private:

    int m_variant = -1;
    int m_num_dims = -1;
    Array1D<RCP<Element>> m_elems;
    Array1D<std::string> m_elem_names;

};

//! \brief Create a problem from its parameters
//! \param params The "problem" and "elements" parameter lists
//! \details See get_valid_problem_params for the accepted keys
RCP<Problem> create_problem(ParameterList const& params);

//! \brief The quadrature order requested by the problem parameters
//! \param params The "problem" and "elements" parameter lists
int get_q_order(ParameterList const& params);

}
