#pragma once

#include "types.hpp"

namespace xr {

/*
 * Physical layout of a 2D grid. Pixel centres are symmetric about the isocentre, so the first pixel sits at
 * origin = -(n - 1) / 2 * spacing.
 */
struct Info
{
  Eigen::Array2f spacing = Eigen::Array2f::Constant(0.8f); // mm
  Eigen::Array2f origin = Eigen::Array2f::Zero();          // mm
};

inline auto CentredInfo(Sz2 const &matrix, Eigen::Array2f const &spacing) -> Info
{
  Eigen::Array2f const half(0.5f * (matrix[0] - 1), 0.5f * (matrix[1] - 1));
  return Info{.spacing = spacing, .origin = -half * spacing};
}

} // namespace xr
