#pragma once

#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif
// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

#include "sys/threads.hpp"

namespace xr {

// Reductions on the global thread pool
template <typename T> typename T::Scalar Sum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> s;
  s.device(xr::Threads::GlobalDevice()) = a.sum();
  return s();
}

template <typename T> typename T::Scalar Mean(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> s;
  s.device(xr::Threads::GlobalDevice()) = a.mean();
  return s();
}

template <typename T> typename T::Scalar Minimum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> m;
  m.device(xr::Threads::GlobalDevice()) = a.minimum();
  return m();
}

template <typename T> typename T::Scalar Maximum(T const &a)
{
  Eigen::TensorFixedSize<typename T::Scalar, Eigen::Sizes<>> m;
  m.device(xr::Threads::GlobalDevice()) = a.maximum();
  return m();
}

} // namespace xr
