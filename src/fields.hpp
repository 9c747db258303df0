#pragma once

//! \file fields.hpp
//! \brief Named element fields and their storage

#include <string>
#include "arrays.hpp"
#include "defines.hpp"

namespace stvk {

//! \brief Type of variable
enum VariableType {
  SCALAR,
  VECTOR
};

//! \brief The closed set of fields an elasticity element may carry
enum FieldName {
  DISPLACEMENT = 0,
  YOUNGS_MODULUS = 1,
  POISSONS_RATIO = 2,
  DISPLACEMENT_LOAD = 3,
  DISPLACEMENT_TRACTION_FORCE = 4,
  NUM_FIELDS = 5
};

//! \brief How the values of a field are stored on an element
enum FieldKind {
  //! \brief One value per component for the whole element
  CONSTANT,
  //! \brief Values per node, interpolated with the element basis
  NODAL,
  //! \brief Values per integration point
  IP,
  //! \brief One expression of (x, y, z, t) per component
  EXPRESSION
};

//! \brief The values of one field on one element
struct Field {
  //! \brief The storage kind of the field
  int kind = CONSTANT;
  //! \brief The number of components per value
  int num_comps = 0;
  //! \brief The values, one row for CONSTANT, per node for NODAL
  //! and per integration point for IP
  Array2D<double> values;
  //! \brief The per-component expressions for EXPRESSION fields
  Array1D<std::string> exprs;
};

//! \brief Get the number of components given a variable type
//! \param type The variable type of interest
//! \param ndims The number of spatial dimensions of the problem
int get_num_eqs(int type, int ndims);

//! \brief Get the variable type of a named field
//! \param name The field of interest
int get_var_type(int name);

//! \brief Get the input name of a field
//! \param name The field of interest
std::string field_name(int name);

//! \brief Get a field from its input name ("youngs modulus", ...)
//! \param name The input name of the field
int get_field(std::string const& name);

//! \brief Get the storage kind of a field from its input name
//! \param name The input name ("constant", "nodal", "ip", "expression")
int get_field_kind(std::string const& name);

//! \brief Create a field with a single value for the whole element
//! \param vals The components of the value
Field constant_field(Array1D<double> const& vals);

//! \brief Create a field with values per node
//! \param vals The node-major values
Field nodal_field(Array2D<double> const& vals);

//! \brief Create a field with values per integration point
//! \param vals The integration-point-major values
Field ip_field(Array2D<double> const& vals);

//! \brief Create a field defined by space/time expressions
//! \param exprs One expression of (x, y, z, t) per component
Field expression_field(Array1D<std::string> const& exprs);

}
