#include <cmath>
#include <iomanip>
#include <iostream>
#include <Teuchos_YamlParameterListHelpers.hpp>
#include <lionPrint.h>
#include "arrays.hpp"
#include "control.hpp"
#include "defines.hpp"
#include "element.hpp"
#include "evaluations.hpp"
#include "integration_point.hpp"
#include "macros.hpp"
#include "problem.hpp"
#include "variant.hpp"

using namespace stvk;

static ParameterList get_valid_params() {
  ParameterList p;
  p.sublist("problem");
  p.sublist("elements");
  p.sublist("regression");
  return p;
}

class Driver {
  public:
    Driver(std::string const& input_file);
    void run();
  private:
    void print_strains(int e);
    void print_residual(int e, EVector const& R);
    void eval_regression(double norm);
  private:
    RCP<ParameterList> m_params;
    RCP<Problem> m_problem;
    double m_time = 0.;
    bool m_eval_regression = false;
};

Driver::Driver(std::string const& input_file) {
  print("reading input: %s", input_file.c_str());
  m_params = rcp(new ParameterList);
  Teuchos::updateParametersFromYamlFile(input_file, m_params.ptr());
  m_params->validateParameters(get_valid_params(), 0);
  m_problem = create_problem(*m_params);
  ParameterList problem_params = m_params->sublist("problem", true);
  m_time = problem_params.get<double>("time", 0.);
  if (m_params->isSublist("regression")) m_eval_regression = true;
  print("variant: %s", variant_name(m_problem->variant()).c_str());
  print("num dims: %d", m_problem->num_dims());
  print("num elems: %d", m_problem->num_elems());
}

void Driver::print_strains(int e) {
  Element& elem = *(m_problem->elem(e));
  int const ndims = m_problem->num_dims();
  for (int pt = 0; pt < elem.num_ips(); ++pt) {
    IntegrationPoint& ip = elem.ip(pt);
    IPResult const result = evaluate_ip(*m_problem, elem, ip, m_time);
    store_state(ip, result);
    if (!ip.has_state("gl strain")) continue;
    Tensor<double> const& E = ip.state("gl strain");
    print(" > ip %d gl strain:", pt);
    for (int i = 0; i < ndims; ++i) {
      if (ndims == 2) print("   %.8e %.8e", E(i, 0), E(i, 1));
      else print("   %.8e %.8e %.8e", E(i, 0), E(i, 1), E(i, 2));
    }
  }
}

void Driver::print_residual(int e, EVector const& R) {
  int const ndims = m_problem->num_dims();
  int const nnodes = m_problem->elem(e)->num_nodes();
  print(" > residual:");
  for (int n = 0; n < nnodes; ++n) {
    if (ndims == 2) {
      print("   node %d: %.16e %.16e", n,
          R(n * ndims + 0), R(n * ndims + 1));
    } else {
      print("   node %d: %.16e %.16e %.16e", n,
          R(n * ndims + 0), R(n * ndims + 1), R(n * ndims + 2));
    }
  }
}

void Driver::eval_regression(double norm) {
  ParameterList regression_params = m_params->sublist("regression", true);
  double const norm_expected = regression_params.get<double>("residual norm");
  double const tol = regression_params.get<double>("relative error tol");
  double err = std::abs(norm - norm_expected);
  if (norm_expected != 0.) err /= std::abs(norm_expected);
  std::cout << std::scientific << std::setprecision(17);
  std::cout << "------ regression summary -----\n";
  std::cout << "norm computed: " << norm << "\n";
  std::cout << "norm expected: " << norm_expected << "\n";
  std::cout << "error: " << err << "\n";
  if (err < tol) std::cout << " PASS\n";
  else {
    std::cout << " FAIL\n";
    abort();
  }
  std::cout << "-------------------------------\n";
}

void Driver::run() {
  double const t0 = time();
  Array1D<EVector> const R = evaluate_elems(*m_problem, m_time);
  double norm2 = 0.;
  for (int e = 0; e < m_problem->num_elems(); ++e) {
    print("element %d (%s)", e, m_problem->elem_name(e).c_str());
    print_strains(e);
    print_residual(e, R[e]);
    norm2 += R[e].squaredNorm();
  }
  double const norm = std::sqrt(norm2);
  double const t1 = time();
  print("residual norm: %.16e", norm);
  print("evaluated in %f seconds", t1 - t0);
  if (m_eval_regression) {
    eval_regression(norm);
  }
}

int main(int argc, char** argv) {
  initialize();
  ALWAYS_ASSERT(argc == 2);
  {
    lion_set_verbosity(1);
    std::string const yaml_input = argv[1];
    Driver driver(yaml_input);
    driver.run();
  }
  finalize();
}
