#pragma once

#ifdef DEBUG
#define EIGEN_INITIALIZE_MATRICES_BY_NAN
#endif

// Need to define EIGEN_USE_THREADS before including these. This is done in CMakeLists.txt
#include <Eigen/Dense>
#include <unsupported/Eigen/CXX11/Tensor>

using Index = Eigen::Index;

namespace xr {

using Re0 = Eigen::TensorFixedSize<float, Eigen::Sizes<>>; // Annoying return type for reductions
template <int N> using ReN = Eigen::Tensor<float, N>;
using Re1 = ReN<1>;
using Re2 = ReN<2>;

using B2 = Eigen::Tensor<bool, 2>; // Region masks

template <int Rank> using Sz = typename Eigen::DSizes<Index, Rank>;
using Sz2 = Sz<2>;

// Positions in mm
using Point2 = Eigen::Matrix<float, 2, 1>;
using Point3 = Eigen::Matrix<float, 3, 1>;

} // namespace xr
