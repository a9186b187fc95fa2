#include "map.hpp"

#include "../errors.hpp"
#include "../tensors.hpp"

#include <cmath>

namespace xr {

auto AttenuationMap::matrix() const -> Sz2 { return mu.dimensions(); }

auto AttenuationMap::halfExtent() const -> Eigen::Array2f
{
  Eigen::Array2f const n(mu.dimension(0), mu.dimension(1));
  return 0.5f * n * info.spacing;
}

auto AttenuationMap::maxThickness() const -> float { return thickness.size() ? Maximum(thickness) : 0.f; }

auto AttenuationMap::inside(Point2 const &p) const -> bool
{
  auto const h = halfExtent();
  return std::abs(p[0]) <= h[0] && std::abs(p[1]) <= h[1];
}

auto Sample(AttenuationMap const &map, Point2 const &p) -> MapSample
{
  float const fi = (p[0] - map.info.origin[0]) / map.info.spacing[0];
  float const fj = (p[1] - map.info.origin[1]) / map.info.spacing[1];
  float const fi0 = std::floor(fi);
  float const fj0 = std::floor(fj);
  Index const i0 = static_cast<Index>(fi0);
  Index const j0 = static_cast<Index>(fj0);
  float const wi = fi - fi0;
  float const wj = fj - fj0;
  Index const nx = map.mu.dimension(0);
  Index const ny = map.mu.dimension(1);

  MapSample s{0.f, 0.f};
  for (Index dj = 0; dj < 2; dj++) {
    Index const j = j0 + dj;
    if (j < 0 || j >= ny) { continue; }
    float const w_j = dj ? wj : 1.f - wj;
    for (Index di = 0; di < 2; di++) {
      Index const i = i0 + di;
      if (i < 0 || i >= nx) { continue; }
      float const w = w_j * (di ? wi : 1.f - wi);
      s.mu += w * map.mu(i, j);
      s.thickness += w * map.thickness(i, j);
    }
  }
  return s;
}

auto Scaled(AttenuationMap const &map, float const f) -> AttenuationMap
{
  if (!std::isfinite(f) || f < 0.f) { throw ParameterError("Attenuation scale must be finite and non-negative, was {}", f); }
  AttenuationMap scaled = map;
  scaled.mu = map.mu * f;
  return scaled;
}

} // namespace xr
