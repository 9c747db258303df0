#include "control.hpp"
#include "fields.hpp"
#include "macros.hpp"

namespace stvk {

static char const* const field_names[NUM_FIELDS] = {
  "displacement",
  "youngs modulus",
  "poissons ratio",
  "displacement load",
  "displacement traction force"
};

static int const field_types[NUM_FIELDS] = {
  VECTOR,
  SCALAR,
  SCALAR,
  VECTOR,
  VECTOR
};

int get_num_eqs(int type, int ndims) {
  int neqs = -1;
  if (type == SCALAR) neqs = 1;
  if (type == VECTOR) neqs = ndims;
  return neqs;
}

int get_var_type(int name) {
  DEBUG_ASSERT(name >= 0 && name < NUM_FIELDS);
  return field_types[name];
}

std::string field_name(int name) {
  DEBUG_ASSERT(name >= 0 && name < NUM_FIELDS);
  return field_names[name];
}

int get_field(std::string const& name) {
  for (int f = 0; f < NUM_FIELDS; ++f) {
    if (name == field_names[f]) return f;
  }
  fail("unknown field: %s", name.c_str());
}

int get_field_kind(std::string const& name) {
  if (name == "constant") return CONSTANT;
  if (name == "nodal") return NODAL;
  if (name == "ip") return IP;
  if (name == "expression") return EXPRESSION;
  fail("unknown field kind: %s", name.c_str());
}

static int count_comps(Array2D<double> const& vals) {
  ALWAYS_ASSERT(vals.size() > 0);
  int const ncomps = vals[0].size();
  for (size_t i = 1; i < vals.size(); ++i) {
    ALWAYS_ASSERT_EQ(int(vals[i].size()), ncomps);
  }
  return ncomps;
}

Field constant_field(Array1D<double> const& vals) {
  Field f;
  f.kind = CONSTANT;
  f.values.push_back(vals);
  f.num_comps = count_comps(f.values);
  return f;
}

Field nodal_field(Array2D<double> const& vals) {
  Field f;
  f.kind = NODAL;
  f.values = vals;
  f.num_comps = count_comps(f.values);
  return f;
}

Field ip_field(Array2D<double> const& vals) {
  Field f;
  f.kind = IP;
  f.values = vals;
  f.num_comps = count_comps(f.values);
  return f;
}

Field expression_field(Array1D<std::string> const& exprs) {
  ALWAYS_ASSERT(exprs.size() > 0);
  Field f;
  f.kind = EXPRESSION;
  f.exprs = exprs;
  f.num_comps = exprs.size();
  return f;
}

}
