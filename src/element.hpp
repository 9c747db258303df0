#pragma once

//! \file element.hpp
//! \brief A single finite element and the fields it carries

#include <string>
#include <apf.h>
#include <apfMesh2.h>
#include "arrays.hpp"
#include "defines.hpp"
#include "fields.hpp"
#include "integration_point.hpp"

namespace stvk {

//! \brief A single first order Lagrange element with named fields
//! \details The element geometry lives in a one-element apf mesh owned
//! by this object. Basis functions and quadrature come from apf. An
//! element whose topological dimension is lower than the number of
//! coordinate components is a boundary element: it supports values
//! (loads, tractions) but not spatial gradients.
class Element {

  public:

    //! \brief Construct an element
    //! \param type The apf element type (apf::Mesh::TRIANGLE, ...)
    //! \param coords The node-major nodal coordinates, with one
    //! component per spatial dimension of the problem
    //! \param q_order The quadrature order of the integration points
    Element(int type, Array2D<double> const& coords, int q_order = 2);

    //! \brief The element destructor
    //! \details Destroys the underlying apf mesh
    ~Element();

    Element(Element const&) = delete;
    Element& operator=(Element const&) = delete;

    //! \brief The apf element type
    int type() const { return m_type; }

    //! \brief The topological dimension of the element
    int elem_dims() const { return m_elem_dims; }

    //! \brief The number of coordinate components per node
    int space_dims() const { return m_space_dims; }

    //! \brief Is this a boundary element (lower dimension than space)
    bool is_boundary() const { return m_elem_dims < m_space_dims; }

    //! \brief The number of nodes in the element
    int num_nodes() const { return m_num_nodes; }

    //! \brief The quadrature order of the integration points
    int q_order() const { return m_q_order; }

    //! \brief The nodal coordinates
    Array2D<double> const& coords() const { return m_coords; }

    //! \brief The number of integration points
    int num_ips() const { return int(m_ips.size()); }

    //! \brief An integration point of this element
    //! \param i The index of the integration point
    IntegrationPoint& ip(int i) { return m_ips[i]; }

    //! \brief An integration point of this element
    //! \param i The index of the integration point
    IntegrationPoint const& ip(int i) const { return m_ips[i]; }

    //! \brief The integration points of this element
    Array1D<IntegrationPoint>& ips() { return m_ips; }

    //! \brief The apf mesh element used for basis evaluations
    apf::MeshElement* apf_elem() const { return m_mesh_elem; }

    //! \brief The field shape of the element basis functions
    apf::FieldShape* shape() const { return m_shape; }

    //! \brief Set (or replace) a field on the element
    //! \param name The field of interest (see FieldName)
    //! \param f The field values
    void set_field(int name, Field const& f);

    //! \brief Remove a field from the element
    //! \param name The field of interest
    void remove_field(int name);

    //! \brief Does the element carry a field
    //! \param name The field of interest
    bool has_field(int name) const;

    //! \brief Get a field that the element carries
    //! \param name The field of interest
    Field const& field(int name) const;

    //! \brief Map an integration point to physical space
    //! \param ip The integration point
    apf::Vector3 x(IntegrationPoint const& ip) const;

    //! \brief The differential volume (determinant of the element map)
    //! \param ip The integration point
    double dv(IntegrationPoint const& ip) const;

    //! \brief Get the value of a scalar field at an integration point
    //! \param name The field of interest
    //! \param ip The integration point
    //! \param t The current time
    double scalar(int name, IntegrationPoint const& ip, double t) const;

    //! \brief Get the value of a vector field at an integration point
    //! \param name The field of interest
    //! \param ip The integration point
    //! \param t The current time
    Vector<double> vector(int name, IntegrationPoint const& ip, double t) const;

    //! \brief Get the spatial gradient of a vector field
    //! \param name The field of interest
    //! \param ip The integration point
    //! \param t The current time
    //! \details Entry (i, j) is the derivative of component i along
    //! direction j. Constant fields have a zero gradient.
    Tensor<double> grad_vector(int name, IntegrationPoint const& ip, double t) const;

    //! \brief Get the values of a field at the element nodes
    //! \param name The field of interest
    //! \param t The current time
    //! \details Constant fields are repeated at each node and expression
    //! fields are evaluated at the nodal coordinates
    Array2D<double> nodal_values(int name, double t) const;

  private:

    void build_mesh();
    void build_ips();
    void check_field(int name, Field const& f) const;
    Array1D<double> values_at(int name, IntegrationPoint const& ip, double t) const;

    int m_type = -1;
    int m_elem_dims = -1;
    int m_space_dims = -1;
    int m_num_nodes = -1;
    int m_q_order = -1;

    Array2D<double> m_coords;
    Array1D<IntegrationPoint> m_ips;
    Array1D<Field> m_fields;
    Array1D<bool> m_has_field;

    apf::Mesh2* m_mesh = nullptr;
    apf::MeshEntity* m_ent = nullptr;
    apf::MeshElement* m_mesh_elem = nullptr;
    apf::FieldShape* m_shape = nullptr;

};

//! \brief Get an apf element type from its input name
//! \param name The input name ("edge", "triangle", "quad", "tet", "hex")
int get_elem_type(std::string const& name);

//! \brief Create an element from its parameters
//! \param params The element parameters ("type", "coords", "fields")
//! \param ndims The number of spatial dimensions of the problem
//! \param q_order The quadrature order of the integration points
RCP<Element> create_element(
    ParameterList const& params,
    int ndims,
    int q_order);

}
