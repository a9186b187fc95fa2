#include "stats.hpp"

#include "../errors.hpp"
#include "../xray/geometry.hpp"
#include "../xray/params.hpp"

#include <algorithm>
#include <cmath>

namespace xr {

namespace {
struct Moments
{
  double sum = 0., sum2 = 0.;
  Index  n = 0;

  void add(float const v)
  {
    sum += v;
    sum2 += double(v) * v;
    n++;
  }
  auto mean() const -> double { return sum / n; }
  auto std() const -> double { return std::sqrt(std::max(0., sum2 / n - mean() * mean())); }
};

void CheckRect(Re2 const &img, Rect const &r, std::string const &name)
{
  if (r.w < 1 || r.h < 1) { throw IndexError("{} rectangle {}x{} is empty", name, r.w, r.h); }
  if (r.x < 0 || r.y < 0 || r.x + r.w > img.dimension(0) || r.y + r.h > img.dimension(1)) {
    throw IndexError("{} rectangle {},{} {}x{} leaves the {} image", name, r.x, r.y, r.w, r.h, img.dimensions());
  }
}

auto Accumulate(Re2 const &img, Rect const &r) -> Moments
{
  Moments m;
  for (Index ij = r.y; ij < r.y + r.h; ij++) {
    for (Index ii = r.x; ii < r.x + r.w; ii++) {
      m.add(img(ii, ij));
    }
  }
  return m;
}

auto Accumulate(Re2 const &img, B2 const &mask, std::string const &name) -> Moments
{
  if (mask.dimension(0) != img.dimension(0) || mask.dimension(1) != img.dimension(1)) {
    throw IndexError("{} mask {} does not match image {}", name, mask.dimensions(), img.dimensions());
  }
  Moments m;
  for (Index ii = 0; ii < img.size(); ii++) {
    if (mask.data()[ii]) { m.add(img.data()[ii]); }
  }
  if (m.n == 0) { throw IndexError("{} mask is empty", name); }
  return m;
}

auto Combine(Moments const &roi, Moments const &bg) -> ROIStat
{
  double const b = bg.mean();
  if (std::abs(b) < 1e-12) { throw DivideByZeroError("Background mean {} is too close to zero for contrast", b); }
  ROIStat const s{.mean = float(roi.mean()), .std = float(roi.std()), .contrast = float(std::abs(roi.mean() - b) / b)};
  Log::Debug("Stats", "ROI mean {} std {} background {} contrast {}", s.mean, s.std, b, s.contrast);
  return s;
}
} // namespace

auto ExtractProfile(Re2 const &img, Index const axis, Index const index) -> Re1
{
  if (axis == 0) {
    if (index < 0 || index >= img.dimension(1)) {
      throw IndexError("Profile index {} outside axis 1 of size {}", index, img.dimension(1));
    }
    return img.chip<1>(index);
  } else if (axis == 1) {
    if (index < 0 || index >= img.dimension(0)) {
      throw IndexError("Profile index {} outside axis 0 of size {}", index, img.dimension(0));
    }
    return img.chip<0>(index);
  } else {
    throw IndexError("Profile axis must be 0 or 1, was {}", axis);
  }
}

auto ROIStats(Re2 const &img, Rect const &roi, Rect const &background) -> ROIStat
{
  CheckRect(img, roi, "ROI");
  CheckRect(img, background, "Background");
  return Combine(Accumulate(img, roi), Accumulate(img, background));
}

auto ROIStats(Re2 const &img, B2 const &roi, B2 const &background) -> ROIStat
{
  return Combine(Accumulate(img, roi, "ROI"), Accumulate(img, background, "Background"));
}

auto RectAround(Geometry const &geom, Detector const &det, Point2 const &centre, float const half) -> Rect
{
  if (!(half > 0.f)) { throw IndexError("ROI half-width must be positive, was {}", half); }
  Point2 const d = geom.toDetector(centre);
  float const  cu = (d[0] - det.offset[0]) / det.pitch + 0.5f * (det.shape[0] - 1);
  float const  cv = (d[1] - det.offset[1]) / det.pitch + 0.5f * (det.shape[1] - 1);
  float const  hp = half * geom.magnification / det.pitch;
  Index const  u0 = std::max<Index>(0, std::lround(cu - hp));
  Index const  u1 = std::min<Index>(det.shape[0] - 1, std::lround(cu + hp));
  Index const  v0 = std::max<Index>(0, std::lround(cv - hp));
  Index const  v1 = std::min<Index>(det.shape[1] - 1, std::lround(cv + hp));
  if (u1 < u0 || v1 < v0) {
    throw IndexError("Region around {},{} mm falls outside the detector", centre[0], centre[1]);
  }
  return Rect{.x = u0, .y = v0, .w = u1 - u0 + 1, .h = v1 - v0 + 1};
}

void AddStats(std::map<std::string, float> &meta, std::string const &prefix, ROIStat const &s)
{
  meta[prefix + "_mean"] = s.mean;
  meta[prefix + "_std"] = s.std;
  meta[prefix + "_contrast"] = s.contrast;
}

auto Percentiles(Eigen::ArrayXf const &vals, std::vector<float> const &ps) -> std::vector<float>
{
  if (vals.size() == 0) { throw Log::Failure("Stats", "Cannot take percentiles of an empty array"); }
  Eigen::ArrayXf x = vals;
  std::sort(x.begin(), x.end());

  std::vector<float> pvals;
  for (auto const p : ps) {
    if (p < 0. || p > 1.) { throw Log::Failure("Stats", "Requested percentile {} outside range 0-1", p); }
    Index const ind = std::clamp(Index(p * (x.size() - 1)), 0L, Index(x.size() - 1));
    pvals.push_back(x[ind]);
  }
  return pvals;
}

} // namespace xr
