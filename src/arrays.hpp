#pragma once

//! \file arrays.hpp
//! \brief Helper methods for multi-dimensional arrays

#include <vector>

namespace stvk {

//! \brief A 1-dimensional array type
//! \tparam The underlying type of the array
template <typename T>
using Array1D = std::vector<T>;

//! \brief A 2-dimensional array type
//! \tparam The underlying type of the array
template <typename T>
using Array2D = std::vector<std::vector<T>>;

//! \brief Resize a 1D array type
//! \param a The array to resize
//! \param ni The number of entries in the first dimension
template <typename T>
void resize(Array1D<T>& a, int ni) {
  a.resize(ni);
}

//! \brief Resize a 2D array type
//! \param a The array to resize
//! \param ni The number of entries in the first dimension
//! \param nj The number of entries in the second dimension
template <typename T>
void resize(Array2D<T>& a, int ni, int nj) {
  a.resize(ni);
  for (int i = 0; i < ni; ++i) {
    a[i].resize(nj);
  }
}

//! \brief Split a flat array into rows of fixed length
//! \param flat The flat (row-major) entries
//! \param nj The number of entries per row
//! \details The flat size must be a multiple of nj
template <typename T>
Array2D<T> unflatten(Array1D<T> const& flat, int nj) {
  int const ni = int(flat.size()) / nj;
  Array2D<T> a;
  resize(a, ni, nj);
  for (int i = 0; i < ni; ++i) {
    for (int j = 0; j < nj; ++j) {
      a[i][j] = flat[i * nj + j];
    }
  }
  return a;
}

}
