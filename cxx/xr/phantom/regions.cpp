#include "regions.hpp"

#include "../log/log.hpp"

namespace xr {

auto Ellipse(float const cx, float const cy, float const rx, float const ry) -> std::function<bool(float const, float const)>
{
  return [=](float const x, float const y) {
    float const dx = (x - cx) / rx;
    float const dy = (y - cy) / ry;
    return dx * dx + dy * dy <= 1.f;
  };
}

auto Disk(float const cx, float const cy, float const r) -> std::function<bool(float const, float const)>
{
  return Ellipse(cx, cy, r, r);
}

auto Linspace(Index const n) -> Eigen::ArrayXf
{
  if (n == 1) { return Eigen::ArrayXf::Zero(1); }
  return Eigen::ArrayXf::LinSpaced(n, -1.f, 1.f);
}

auto Draw(Sz2 const &matrix, Regions const &regions) -> Re2
{
  Re2 grid(matrix);
  grid.setZero();
  auto const xs = Linspace(matrix[0]);
  auto const ys = Linspace(matrix[1]);
  for (auto const &r : regions) {
    Index count = 0;
    for (Index ij = 0; ij < matrix[1]; ij++) {
      for (Index ii = 0; ii < matrix[0]; ii++) {
        if (r.contains(xs[ii], ys[ij])) {
          grid(ii, ij) = r.mu;
          count++;
        }
      }
    }
    Log::Debug("Phan", "Region {} mu {} covers {} pixels", r.name, r.mu, count);
  }
  return grid;
}

auto Footprint(Sz2 const &matrix, std::function<bool(float const, float const)> const &contains) -> B2
{
  B2         mask(matrix);
  auto const xs = Linspace(matrix[0]);
  auto const ys = Linspace(matrix[1]);
  for (Index ij = 0; ij < matrix[1]; ij++) {
    for (Index ii = 0; ii < matrix[0]; ii++) {
      mask(ii, ij) = contains(xs[ii], ys[ij]);
    }
  }
  return mask;
}

} // namespace xr
