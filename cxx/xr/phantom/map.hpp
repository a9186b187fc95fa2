#pragma once

#include "../info.hpp"
#include "../types.hpp"

namespace xr {

/*
 * In-plane attenuation coefficients (1/cm) and the slab thickness (mm) the beam crosses at each position. Both share
 * the same grid, described by info.
 */
struct AttenuationMap
{
  Re2  mu;
  Re2  thickness;
  Info info;

  auto matrix() const -> Sz2;
  auto halfExtent() const -> Eigen::Array2f; // mm from the centre to the outer pixel edge
  auto maxThickness() const -> float;
  auto inside(Point2 const &p) const -> bool;
};

struct MapSample
{
  float mu, thickness;
};

/*
 * Bilinear interpolation of both channels at p (mm). Neighbours that fall off the grid count as air.
 */
auto Sample(AttenuationMap const &map, Point2 const &p) -> MapSample;

auto Scaled(AttenuationMap const &map, float const f) -> AttenuationMap;

} // namespace xr
