#pragma once

#include "../types.hpp"

#include <functional>
#include <string>
#include <vector>

namespace xr {

/*
 * A named footprint in normalised coordinates (-1 to 1 across the grid on both axes) with its own attenuation.
 */
struct Region
{
  std::string                                name;
  std::function<bool(float const, float const)> contains;
  float                                      mu;
};

using Regions = std::vector<Region>;

auto Ellipse(float const cx, float const cy, float const rx, float const ry) -> std::function<bool(float const, float const)>;
auto Disk(float const cx, float const cy, float const r) -> std::function<bool(float const, float const)>;

/*
 * Normalised coordinate of each pixel centre along one axis, -1 at the first pixel and 1 at the last.
 */
auto Linspace(Index const n) -> Eigen::ArrayXf;

/*
 * Draws the regions in order onto a fresh grid. Later regions overwrite earlier ones inside their own footprint.
 */
auto Draw(Sz2 const &matrix, Regions const &regions) -> Re2;

/*
 * Boolean footprint of a single predicate on the grid.
 */
auto Footprint(Sz2 const &matrix, std::function<bool(float const, float const)> const &contains) -> B2;

} // namespace xr
