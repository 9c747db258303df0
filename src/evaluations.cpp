#include "control.hpp"
#include "elasticity.hpp"
#include "element.hpp"
#include "evaluations.hpp"
#include "fad.hpp"
#include "macros.hpp"
#include "problem.hpp"

namespace stvk {

static IPResult get_result(Elasticity<double> const& resid) {
  IPResult result;
  result.R = resid.eigen_residual();
  result.has_stress = resid.has_stress();
  if (result.has_stress) {
    result.F = resid.F();
    result.E = resid.E();
    result.S = resid.S();
    result.cauchy = resid.cauchy();
  }
  return result;
}

static IPResult eval_ip(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t,
    EVector const* u) {
  Elasticity<double> resid(problem.variant(), problem.num_dims());
  resid.set_elem(elem);
  if (u) resid.gather(*u);
  else resid.gather(t);
  resid.zero_residual();
  resid.interpolate(ip);
  resid.evaluate(ip, t);
  IPResult const result = get_result(resid);
  resid.unset_elem();
  return result;
}

IPResult evaluate_ip(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t) {
  return eval_ip(problem, elem, ip, t, nullptr);
}

IPResult evaluate_ip(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t,
    EVector const& u) {
  return eval_ip(problem, elem, ip, t, &u);
}

static EMatrix eval_ip_jacobian(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t,
    EVector const* u) {
  Elasticity<FADT> resid(problem.variant(), problem.num_dims());
  resid.set_elem(elem);
  if (u) resid.gather(*u);
  else resid.gather(t);
  resid.seed_wrt_u();
  resid.zero_residual();
  resid.interpolate(ip);
  resid.evaluate(ip, t);
  EMatrix const dR_du = resid.eigen_jacobian();
  resid.unseed_wrt_u();
  resid.unset_elem();
  return dR_du;
}

EMatrix evaluate_ip_jacobian(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t) {
  return eval_ip_jacobian(problem, elem, ip, t, nullptr);
}

EMatrix evaluate_ip_jacobian(
    Problem const& problem,
    Element const& elem,
    IntegrationPoint const& ip,
    double t,
    EVector const& u) {
  return eval_ip_jacobian(problem, elem, ip, t, &u);
}

static EVector integrate_R(
    Problem const& problem,
    Element const& elem,
    double t,
    EVector const* u) {
  int const ndofs = elem.num_nodes() * problem.num_dims();
  EVector R = EVector::Zero(ndofs);
  for (int pt = 0; pt < elem.num_ips(); ++pt) {
    IntegrationPoint const& ip = elem.ip(pt);
    double const w = ip.w();
    double const dv = elem.dv(ip);
    IPResult const result = eval_ip(problem, elem, ip, t, u);
    R += result.R * w * dv;
  }
  return R;
}

EVector integrate_residual(
    Problem const& problem,
    Element const& elem,
    double t) {
  return integrate_R(problem, elem, t, nullptr);
}

EVector integrate_residual(
    Problem const& problem,
    Element const& elem,
    double t,
    EVector const& u) {
  return integrate_R(problem, elem, t, &u);
}

static EMatrix integrate_dR_du(
    Problem const& problem,
    Element const& elem,
    double t,
    EVector const* u) {
  int const ndofs = elem.num_nodes() * problem.num_dims();
  EMatrix dR_du = EMatrix::Zero(ndofs, ndofs);
  for (int pt = 0; pt < elem.num_ips(); ++pt) {
    IntegrationPoint const& ip = elem.ip(pt);
    double const w = ip.w();
    double const dv = elem.dv(ip);
    dR_du += eval_ip_jacobian(problem, elem, ip, t, u) * w * dv;
  }
  return dR_du;
}

EMatrix integrate_jacobian(
    Problem const& problem,
    Element const& elem,
    double t) {
  return integrate_dR_du(problem, elem, t, nullptr);
}

EMatrix integrate_jacobian(
    Problem const& problem,
    Element const& elem,
    double t,
    EVector const& u) {
  return integrate_dR_du(problem, elem, t, &u);
}

Array1D<EVector> evaluate_elems(Problem const& problem, double t) {
  Array1D<EVector> R(problem.num_elems());
  for (int e = 0; e < problem.num_elems(); ++e) {
    R[e] = integrate_residual(problem, *(problem.elem(e)), t);
  }
  return R;
}

void store_state(IntegrationPoint& ip, IPResult const& result) {
  if (!result.has_stress) return;
  ip.set_state("gl strain", result.E);
  ip.set_state("cauchy stress", result.cauchy);
}

}
