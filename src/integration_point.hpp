#pragma once

//! \file integration_point.hpp
//! \brief Quadrature points and their auxiliary state

#include <map>
#include <string>
#include <apf.h>
#include "defines.hpp"

namespace stvk {

//! \brief A quadrature point of an element
//! \details The local coordinate and weight come from the element
//! quadrature rule. The auxiliary state is only written by callers
//! that choose to persist evaluated quantities (see store_state).
class IntegrationPoint {

  public:

    //! \brief Construct an integration point
    //! \param idx The index of the point within its element
    //! \param iota The point in the reference element space
    //! \param w The quadrature weight of the point
    IntegrationPoint(int idx, apf::Vector3 const& iota, double w) :
      m_idx(idx), m_iota(iota), m_w(w) {}

    //! \brief The index of the point within its element
    int idx() const { return m_idx; }

    //! \brief The point in the reference element space
    apf::Vector3 const& iota() const { return m_iota; }

    //! \brief The quadrature weight
    double w() const { return m_w; }

    //! \brief Overwrite an auxiliary state entry
    //! \param key The name of the entry (e.g. "gl strain")
    //! \param value The tensor to store
    void set_state(std::string const& key, Tensor<double> const& value) {
      m_state.erase(key);
      m_state.insert(std::make_pair(key, value));
    }

    //! \brief Does an auxiliary state entry exist
    //! \param key The name of the entry
    bool has_state(std::string const& key) const {
      return m_state.count(key) > 0;
    }

    //! \brief Get an auxiliary state entry
    //! \param key The name of the entry, which must exist
    Tensor<double> const& state(std::string const& key) const {
      return m_state.at(key);
    }

  private:

    int m_idx = -1;
    apf::Vector3 m_iota;
    double m_w = 0.;
    std::map<std::string, Tensor<double>> m_state;

};

}
