#include "control.hpp"
#include "element.hpp"
#include "macros.hpp"
#include "problem.hpp"
#include "variant.hpp"

namespace stvk {

Problem::Problem(
    int variant,
    int ndims,
    Array1D<RCP<Element>> const& elems) {
  m_variant = variant;
  m_num_dims = (ndims < 0) ? default_num_dims(variant) : ndims;
  if (m_num_dims != 2 && m_num_dims != 3) {
    fail("unsupported number of dimensions: %d", m_num_dims);
  }
  for (size_t e = 0; e < elems.size(); ++e) {
    add_elem(elems[e]);
  }
}

void Problem::add_elem(RCP<Element> elem, std::string const& name) {
  ALWAYS_ASSERT(elem != Teuchos::null);
  ALWAYS_ASSERT_EQ(elem->space_dims(), m_num_dims);
  m_elems.push_back(elem);
  m_elem_names.push_back(name);
}

static ParameterList get_valid_problem_params() {
  ParameterList p;
  p.set<std::string>("variant", "");
  p.set<int>("num dims", -1);
  p.set<int>("quadrature order", 2);
  p.set<double>("time", 0.);
  return p;
}

int get_q_order(ParameterList const& params) {
  ParameterList problem_params = params.sublist("problem");
  return problem_params.get<int>("quadrature order", 2);
}

RCP<Problem> create_problem(ParameterList const& params) {
  ParameterList problem_params = params.sublist("problem");
  problem_params.validateParameters(get_valid_problem_params(), 0);
  std::string const name = problem_params.get<std::string>("variant");
  int const variant = get_variant(name);
  int const ndims = problem_params.get<int>("num dims", -1);
  int const q_order = get_q_order(params);
  RCP<Problem> problem = rcp(new Problem(variant, ndims));
  if (!params.isSublist("elements")) return problem;
  ParameterList const& elems = params.sublist("elements");
  for (auto it = elems.begin(); it != elems.end(); ++it) {
    std::string const& elem_name = elems.name(it);
    ParameterList const& elem_params = elems.sublist(elem_name);
    RCP<Element> elem =
      create_element(elem_params, problem->num_dims(), q_order);
    problem->add_elem(elem, elem_name);
  }
  return problem;
}

}
