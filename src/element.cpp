#include <gmi.h>
#include <gmi_null.h>
#include <apfMDS.h>
#include <apfShape.h>
#include <Teuchos_Array.hpp>
#include "basis.hpp"
#include "control.hpp"
#include "element.hpp"
#include "macros.hpp"

namespace stvk {

static int count_nodes(apf::FieldShape* s, int type) {
  apf::EntityShape* ent_shape = s->getEntityShape(type);
  return ent_shape->countNodes();
}

Element::Element(int type, Array2D<double> const& coords, int q_order) {
  ALWAYS_ASSERT(coords.size() > 0);
  m_type = type;
  m_elem_dims = apf::Mesh::typeDimension[type];
  m_space_dims = coords[0].size();
  m_q_order = q_order;
  m_coords = coords;
  m_shape = apf::getLagrange(1);
  m_num_nodes = count_nodes(m_shape, m_type);
  ALWAYS_ASSERT_EQ(int(coords.size()), m_num_nodes);
  ALWAYS_ASSERT(m_space_dims >= m_elem_dims && m_space_dims <= 3);
  for (size_t n = 0; n < coords.size(); ++n) {
    ALWAYS_ASSERT_EQ(int(coords[n].size()), m_space_dims);
  }
  m_fields.resize(NUM_FIELDS);
  m_has_field.resize(NUM_FIELDS, false);
  build_mesh();
  build_ips();
}

Element::~Element() {
  apf::destroyMeshElement(m_mesh_elem);
  m_mesh->destroyNative();
  apf::destroyMesh(m_mesh);
}

static void register_null_model() {
  static bool is_registered = false;
  if (is_registered) return;
  gmi_register_null();
  is_registered = true;
}

void Element::build_mesh() {
  ALWAYS_ASSERT_VERBOSE(is_initialized(),
      "elements require stvk::initialize()");
  register_null_model();
  gmi_model* model = gmi_load(".null");
  m_mesh = apf::makeEmptyMdsMesh(model, m_elem_dims, false);
  Array1D<apf::Vector3> points(m_num_nodes, apf::Vector3(0, 0, 0));
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int d = 0; d < m_space_dims; ++d) {
      points[n][d] = m_coords[n][d];
    }
  }
  apf::buildOneElement(m_mesh, 0, m_type, &(points[0]));
  apf::deriveMdsModel(m_mesh);
  m_mesh->acceptChanges();
  apf::MeshIterator* elems = m_mesh->begin(m_elem_dims);
  m_ent = m_mesh->iterate(elems);
  m_mesh->end(elems);
  ALWAYS_ASSERT(m_ent);
  m_mesh_elem = apf::createMeshElement(m_mesh, m_ent);
}

void Element::build_ips() {
  apf::Vector3 iota;
  int const npts = apf::countIntPoints(m_mesh_elem, m_q_order);
  for (int pt = 0; pt < npts; ++pt) {
    apf::getIntPoint(m_mesh_elem, m_q_order, pt, iota);
    double const w = apf::getIntWeight(m_mesh_elem, m_q_order, pt);
    m_ips.push_back(IntegrationPoint(pt, iota, w));
  }
}

void Element::check_field(int name, Field const& f) const {
  int const ncomps = get_num_eqs(get_var_type(name), m_space_dims);
  if (f.num_comps != ncomps) {
    fail("field '%s' has %d components, expected %d",
        field_name(name).c_str(), f.num_comps, ncomps);
  }
  if (name == DISPLACEMENT && f.kind == IP) {
    fail("field '%s' needs nodal values, not ip values",
        field_name(name).c_str());
  }
  if (f.kind == NODAL) {
    ALWAYS_ASSERT_EQ(int(f.values.size()), m_num_nodes);
  }
  if (f.kind == IP) {
    ALWAYS_ASSERT_EQ(int(f.values.size()), num_ips());
  }
}

void Element::set_field(int name, Field const& f) {
  DEBUG_ASSERT(name >= 0 && name < NUM_FIELDS);
  check_field(name, f);
  m_fields[name] = f;
  m_has_field[name] = true;
}

void Element::remove_field(int name) {
  DEBUG_ASSERT(name >= 0 && name < NUM_FIELDS);
  m_fields[name] = Field();
  m_has_field[name] = false;
}

bool Element::has_field(int name) const {
  DEBUG_ASSERT(name >= 0 && name < NUM_FIELDS);
  return m_has_field[name];
}

Field const& Element::field(int name) const {
  if (!has_field(name)) {
    fail("element has no field '%s'", field_name(name).c_str());
  }
  return m_fields[name];
}

apf::Vector3 Element::x(IntegrationPoint const& ip) const {
  apf::Vector3 pt;
  apf::mapLocalToGlobal(m_mesh_elem, ip.iota(), pt);
  return pt;
}

double Element::dv(IntegrationPoint const& ip) const {
  return apf::getDV(m_mesh_elem, ip.iota());
}

Array1D<double> Element::values_at(
    int name,
    IntegrationPoint const& ip,
    double t) const {
  Field const& f = field(name);
  Array1D<double> vals(f.num_comps, 0.);
  if (f.kind == CONSTANT) {
    vals = f.values[0];
  } else if (f.kind == NODAL) {
    Basis basis(m_shape);
    basis.evaluate(m_mesh_elem, ip.iota(), false);
    for (int n = 0; n < m_num_nodes; ++n) {
      for (int c = 0; c < f.num_comps; ++c) {
        vals[c] += f.values[n][c] * basis.val(n);
      }
    }
  } else if (f.kind == IP) {
    DEBUG_ASSERT(ip.idx() >= 0 && ip.idx() < int(f.values.size()));
    vals = f.values[ip.idx()];
  } else if (f.kind == EXPRESSION) {
    apf::Vector3 const pt = x(ip);
    for (int c = 0; c < f.num_comps; ++c) {
      vals[c] = eval(f.exprs[c], pt[0], pt[1], pt[2], t);
    }
  } else {
    fail("unknown field kind: %d", f.kind);
  }
  return vals;
}

double Element::scalar(int name, IntegrationPoint const& ip, double t) const {
  DEBUG_ASSERT(get_var_type(name) == SCALAR);
  return values_at(name, ip, t)[0];
}

Vector<double> Element::vector(
    int name,
    IntegrationPoint const& ip,
    double t) const {
  DEBUG_ASSERT(get_var_type(name) == VECTOR);
  Array1D<double> const vals = values_at(name, ip, t);
  Vector<double> v(m_space_dims);
  for (int d = 0; d < m_space_dims; ++d) {
    v(d) = vals[d];
  }
  return v;
}

Array2D<double> Element::nodal_values(int name, double t) const {
  Field const& f = field(name);
  Array2D<double> vals;
  if (f.kind == CONSTANT) {
    vals.assign(m_num_nodes, f.values[0]);
  } else if (f.kind == NODAL) {
    vals = f.values;
  } else if (f.kind == EXPRESSION) {
    resize(vals, m_num_nodes, f.num_comps);
    for (int n = 0; n < m_num_nodes; ++n) {
      double pt[3] = {0., 0., 0.};
      for (int d = 0; d < m_space_dims; ++d) pt[d] = m_coords[n][d];
      for (int c = 0; c < f.num_comps; ++c) {
        vals[n][c] = eval(f.exprs[c], pt[0], pt[1], pt[2], t);
      }
    }
  } else {
    fail("field '%s' has no nodal values", field_name(name).c_str());
  }
  return vals;
}

Tensor<double> Element::grad_vector(
    int name,
    IntegrationPoint const& ip,
    double t) const {
  DEBUG_ASSERT(get_var_type(name) == VECTOR);
  ALWAYS_ASSERT_VERBOSE(!is_boundary(),
      "spatial gradients need an element of the problem dimension");
  int const ndims = m_space_dims;
  Tensor<double> grad = minitensor::zero<double>(ndims);
  if (field(name).kind == CONSTANT) return grad;
  Array2D<double> const u = nodal_values(name, t);
  Basis basis(m_shape);
  basis.evaluate(m_mesh_elem, ip.iota());
  for (int n = 0; n < m_num_nodes; ++n) {
    for (int i = 0; i < ndims; ++i) {
      for (int j = 0; j < ndims; ++j) {
        grad(i, j) += u[n][i] * basis.grad(n, j);
      }
    }
  }
  return grad;
}

int get_elem_type(std::string const& name) {
  if (name == "edge") return apf::Mesh::EDGE;
  if (name == "triangle") return apf::Mesh::TRIANGLE;
  if (name == "quad") return apf::Mesh::QUAD;
  if (name == "tet") return apf::Mesh::TET;
  if (name == "hex") return apf::Mesh::HEX;
  fail("unknown element type: %s", name.c_str());
}

static ParameterList get_valid_elem_params() {
  ParameterList p;
  p.set<std::string>("type", "");
  p.set<Teuchos::Array<double>>("coords", Teuchos::Array<double>());
  p.sublist("fields");
  return p;
}

static Field read_field(ParameterList const& p, int name, int ndims) {
  int const ncomps = get_num_eqs(get_var_type(name), ndims);
  int num_kinds = 0;
  Field f;
  for (auto it = p.begin(); it != p.end(); ++it) {
    std::string const& kind_name = p.name(it);
    int const kind = get_field_kind(kind_name);
    auto pentry = p.entry(it);
    if (kind == EXPRESSION) {
      auto a = Teuchos::getValue<Teuchos::Array<std::string>>(pentry);
      if (a.size() == 0) {
        fail("field '%s' has no values", field_name(name).c_str());
      }
      f = expression_field(a.toVector());
    } else {
      auto a = Teuchos::getValue<Teuchos::Array<double>>(pentry);
      Array1D<double> const flat = a.toVector();
      if (flat.size() == 0) {
        fail("field '%s' has no values", field_name(name).c_str());
      }
      if (kind == CONSTANT && int(flat.size()) != ncomps) {
        fail("constant field '%s' has %d values, expected %d",
            field_name(name).c_str(), int(flat.size()), ncomps);
      }
      if (int(flat.size()) % ncomps != 0) {
        fail("field '%s' has %d values, not a multiple of %d",
            field_name(name).c_str(), int(flat.size()), ncomps);
      }
      Array2D<double> const vals = unflatten(flat, ncomps);
      if (kind == CONSTANT) f = constant_field(vals[0]);
      if (kind == NODAL) f = nodal_field(vals);
      if (kind == IP) f = ip_field(vals);
    }
    ++num_kinds;
  }
  if (num_kinds != 1) {
    fail("field '%s' needs exactly one of constant/nodal/ip/expression",
        field_name(name).c_str());
  }
  return f;
}

RCP<Element> create_element(
    ParameterList const& params,
    int ndims,
    int q_order) {
  params.validateParameters(get_valid_elem_params(), 0);
  std::string const type_name = params.get<std::string>("type");
  int const type = get_elem_type(type_name);
  Array1D<double> const flat =
    params.get<Teuchos::Array<double>>("coords").toVector();
  if (flat.size() == 0 || int(flat.size()) % ndims != 0) {
    fail("element coords must hold %d components per node", ndims);
  }
  Array2D<double> const coords = unflatten(flat, ndims);
  RCP<Element> elem = rcp(new Element(type, coords, q_order));
  if (!params.isSublist("fields")) return elem;
  ParameterList const& fields = params.sublist("fields");
  for (auto it = fields.begin(); it != fields.end(); ++it) {
    std::string const& name = fields.name(it);
    int const f = get_field(name);
    elem->set_field(f, read_field(fields.sublist(name), f, ndims));
  }
  return elem;
}

}
