#pragma once

//! \file defines.hpp
//! \brief Code-wide definitions

#include <MiniTensor.h>
#include <Sacado_Fad_SLFad.hpp>
#include <Teuchos_ParameterList.hpp>
#include <Teuchos_RCP.hpp>
#include "Eigen/Core"

namespace stvk {

//! \brief The number of maximum derivatives for the FAD type
//! \details An 8-node hexahedron in 3D carries 24 displacement dofs
static constexpr int nmax_derivs = 24;

//! \brief Forward automatic differention type
using FADT = Sacado::Fad::SLFad<double, nmax_derivs>;

//! \brief The small dense linear algebra vector type
template <typename T>
using Vector = minitensor::Vector<T>;

//! \brief The small dense linear algebra tensor type
template <typename T>
using Tensor = minitensor::Tensor<T>;

//! \brief The small dense linear algebra Eigen vector
using EVector = Eigen::Matrix<double, Eigen::Dynamic, 1>;

//! \brief The small dense linear algebra Eigen matrix
using EMatrix = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic>;

//! \brief Reference counted pointer
using Teuchos::rcp;

//! \brief Reference counted pointer
using Teuchos::RCP;

//! \brief Parameter list
using Teuchos::ParameterList;

}
