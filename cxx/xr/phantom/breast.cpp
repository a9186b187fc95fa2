#include "breast.hpp"

#include "../errors.hpp"
#include "../log/debug.hpp"
#include "regions.hpp"

#include <cmath>

namespace xr {

namespace {
struct Spot
{
  float x, y, r;
};

// Fixed so the phantom is reproducible
std::vector<Spot> const Calcifications{{-0.30f, -0.05f, 0.02f},  {-0.22f, 0.02f, 0.015f}, {-0.35f, 0.08f, 0.025f},
                                       {-0.18f, -0.12f, 0.018f}, {-0.40f, -0.15f, 0.03f}, {-0.26f, -0.25f, 0.02f},
                                       {-0.12f, 0.45f, 0.04f}};

auto Rho2(float const x, float const y) -> float { return x * x / 0.81f + y * y; }
auto InSilhouette(float const x, float const y) -> bool { return Rho2(x, y) <= 1.f; }

auto InGland(float const x, float const y) -> bool
{
  static auto const e1 = Ellipse(-0.15f, 0.f, 0.55f, 0.6f);
  static auto const e2 = Ellipse(-0.05f, -0.15f, 0.45f, 0.5f);
  return InSilhouette(x, y) && (e1(x, y) || e2(x, y));
}

/*
 * A disk is accepted when its centre and a ring of points on its boundary all satisfy the predicate.
 */
template <typename F> auto DiskWithin(Spot const &s, F const &f) -> bool
{
  if (!f(s.x, s.y)) { return false; }
  Index const nRing = 64;
  for (Index ii = 0; ii < nRing; ii++) {
    float const a = 2.f * M_PI * ii / nRing;
    if (!f(s.x + s.r * std::cos(a), s.y + s.r * std::sin(a))) { return false; }
  }
  return true;
}
} // namespace

auto BreastPhantom(PhantomOptions const &opts) -> Phantom
{
  if (opts.matrix[0] < 2 || opts.matrix[1] < 2) { throw ParameterError("Phantom matrix {} is too small", opts.matrix); }
  if (!(opts.spacing > 0.f) || !std::isfinite(opts.spacing)) {
    throw ParameterError("Phantom spacing must be positive, was {}", opts.spacing);
  }
  if (!(opts.thickness > 0.f) || !std::isfinite(opts.thickness)) {
    throw ParameterError("Phantom thickness must be positive, was {}", opts.thickness);
  }
  if (!(opts.thicknessScale > 0.f && opts.thicknessScale <= 1.f)) {
    throw ParameterError("Thickness scale must be in (0, 1], was {}", opts.thicknessScale);
  }

  Spot const lesion{opts.lesionX, opts.lesionY, opts.lesionRadius};
  if (!(lesion.r > 0.f)) { throw ParameterError("Lesion radius must be positive, was {}", lesion.r); }
  if (opts.lesion && !DiskWithin(lesion, InGland)) {
    throw Log::Failure("Phan", "Lesion at {},{} radius {} is not inside the glandular core", lesion.x, lesion.y, lesion.r);
  }
  if (opts.calcifications) {
    for (auto const &c : Calcifications) {
      if (!DiskWithin(c, InSilhouette)) {
        throw Log::Failure("Phan", "Calcification at {},{} radius {} leaves the silhouette", c.x, c.y, c.r);
      }
    }
  }

  Log::Print("Phan", "Drawing breast phantom matrix {} spacing {} mm{}{}{}", opts.matrix, opts.spacing,
             opts.compression ? " compressed" : "", opts.lesion ? " lesion" : "", opts.calcifications ? " calcs" : "");

  Regions regions{{"adipose", InSilhouette, Tissue::Adipose},
                  {"gland", InGland, Tissue::Gland},
                  {"pectoral",
                   [](float const x, float const y) { return InSilhouette(x, y) && y > -0.2f && x < -0.9f + 0.375f * (y + 0.2f); },
                   Tissue::Muscle},
                  {"skin", [](float const x, float const y) { return InSilhouette(x, y) && Rho2(x, y) >= 0.94f; }, Tissue::Skin},
                  {"benign",
                   [e = Ellipse(-0.35f, 0.25f, 0.12f, 0.08f)](float const x, float const y) { return InSilhouette(x, y) && e(x, y); },
                   Tissue::Benign}};
  if (opts.lesion) { regions.push_back({"lesion", Disk(lesion.x, lesion.y, lesion.r), Tissue::Lesion}); }
  if (opts.calcifications) {
    for (auto const &c : Calcifications) {
      regions.push_back({"calcification", Disk(c.x, c.y, c.r), Tissue::Calcification});
    }
  }

  Phantom phantom;
  phantom.map.info = CentredInfo(opts.matrix, Eigen::Array2f::Constant(opts.spacing));
  phantom.map.mu = Draw(opts.matrix, regions);

  float const scale = opts.compression ? opts.thicknessScale : 1.f;
  auto const  xs = Linspace(opts.matrix[0]);
  auto const  ys = Linspace(opts.matrix[1]);
  phantom.map.thickness.resize(opts.matrix);
  for (Index ij = 0; ij < opts.matrix[1]; ij++) {
    for (Index ii = 0; ii < opts.matrix[0]; ii++) {
      float const r2 = Rho2(xs[ii], ys[ij]);
      phantom.map.thickness(ii, ij) = r2 <= 1.f ? opts.thickness * scale * (0.8f + 0.2f * std::exp(-3.f * r2)) : 0.f;
    }
  }

  // Normalised coordinates run over pixel centres
  Eigen::Array2f const toMM(0.5f * (opts.matrix[0] - 1) * opts.spacing, 0.5f * (opts.matrix[1] - 1) * opts.spacing);
  phantom.landmarks.lesion = Point2(lesion.x * toMM[0], lesion.y * toMM[1]);
  phantom.landmarks.lesionRadius = lesion.r * toMM.minCoeff();
  phantom.landmarks.background = Point2(lesion.x * toMM[0], -lesion.y * toMM[1]);
  phantom.lesionMask = Footprint(opts.matrix, Disk(lesion.x, lesion.y, lesion.r));
  phantom.backgroundMask = Footprint(opts.matrix, Disk(lesion.x, -lesion.y, lesion.r));

  Log::Tensor("mu", HD5::Shape<2>{opts.matrix[0], opts.matrix[1]}, phantom.map.mu.data(), HD5::Dims::Map);
  Log::Tensor("thickness", HD5::Shape<2>{opts.matrix[0], opts.matrix[1]}, phantom.map.thickness.data(), HD5::Dims::Map);
  return phantom;
}

} // namespace xr
