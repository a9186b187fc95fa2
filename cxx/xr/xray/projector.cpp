#include "projector.hpp"

#include "../errors.hpp"
#include "../log/debug.hpp"
#include "../sys/threads.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace xr {

namespace {
struct Slab
{
  Index n;
  float z0, dz;
};

auto MakeSlab(AttenuationMap const &map, Index const n) -> Slab
{
  if (n < 1) { throw ParameterError("Need at least one depth sample, asked for {}", n); }
  float const T = map.maxThickness();
  return Slab{.n = n, .z0 = -0.5f * T, .dz = T / n};
}

/*
 * Line integral of mu for the ray to detector position d. Each depth bin adds mu times the part of the bin that lies
 * inside the slab at the sampled position. hit is set when any sample lands on the map.
 */
auto Integrate(AttenuationMap const &map, Geometry const &g, Slab const &slab, Point2 const &d, bool &hit) -> float
{
  float const obliquity = 1.f / g.direction(d)[2];
  float       L = 0.f;
  for (Index ik = 0; ik < slab.n; ik++) {
    float const za = slab.z0 + ik * slab.dz;
    float const zb = za + slab.dz;
    float const zc = za + 0.5f * slab.dz;
    if (zc + g.sid <= 0.f) { continue; } // Behind the source
    Point2 const p = g.toObject(d, zc);
    if (!map.inside(p)) { continue; }
    hit = true;
    auto const  s = Sample(map, p);
    float const h = 0.5f * s.thickness;
    float const overlap = std::max(0.f, std::min(zb, h) - std::max(za, -h));
    L += s.mu * overlap;
  }
  return L * obliquity * 0.1f; // mm to cm
}

void ProjectInto(AttenuationMap const &map,
                 Geometry const       &g,
                 Beam const           &beam,
                 Detector const       &det,
                 Slab const           &slab,
                 Index const           iv,
                 float                *line,
                 bool                 &hit)
{
  for (Index iu = 0; iu < det.shape[0]; iu++) {
    line[iu] = beam.transmit(Integrate(map, g, slab, DetectorPosition(det, iu, iv), hit));
  }
}
} // namespace

auto DetectorPosition(Detector const &det, Index const iu, Index const iv) -> Point2
{
  return Point2((iu - 0.5f * (det.shape[0] - 1)) * det.pitch + det.offset[0],
                (iv - 0.5f * (det.shape[1] - 1)) * det.pitch + det.offset[1]);
}

void CheckDetector(Detector const &det)
{
  if (det.shape[0] < 1 || det.shape[1] < 1) { throw ParameterError("Detector shape {} must be positive", det.shape); }
  if (!(det.pitch > 0.f) || !std::isfinite(det.pitch)) { throw ParameterError("Detector pitch {} must be positive", det.pitch); }
  if (!det.offset.isFinite().all()) { throw ParameterError("Detector offset {},{} is not finite", det.offset[0], det.offset[1]); }
}

auto Project(AttenuationMap const &map, Geometry const &g, Beam const &beam, Detector const &det, ProjectorOpts const &opts)
  -> Re2
{
  CheckDetector(det);
  Slab const slab = MakeSlab(map, opts.depthSamples);
  Log::Debug("Proj", "Projecting angle {} onto {} detector, {} depth bins of {} mm", g.angle, det.shape, slab.n, slab.dz);

  Re2                       I(det.shape);
  std::vector<std::uint8_t> hits(det.shape[1], 0);
  auto const                line = [&](Index const iv) {
    bool hit = false;
    ProjectInto(map, g, beam, det, slab, iv, &I(0, iv), hit);
    hits[iv] = hit;
  };
  if (opts.threaded) {
    Threads::For(line, det.shape[1], "Project");
  } else {
    for (Index iv = 0; iv < det.shape[1]; iv++) {
      line(iv);
    }
  }
  if (std::none_of(hits.begin(), hits.end(), [](std::uint8_t const h) { return h; })) {
    throw ProjectionError("No ray at angle {} samples inside the map, check the detector offset {},{} mm", g.angle,
                          det.offset[0], det.offset[1]);
  }
  if (opts.threaded) { Log::Tensor("radiograph", HD5::Shape<2>{det.shape[0], det.shape[1]}, I.data(), HD5::Dims::Radiograph); }
  return I;
}

auto ProjectLine(
  AttenuationMap const &map, Geometry const &g, Beam const &beam, Detector const &det, Index const v, ProjectorOpts const &opts)
  -> Re1
{
  CheckDetector(det);
  if (v < 0 || v >= det.shape[1]) { throw IndexError("Detector line {} outside detector with {} lines", v, det.shape[1]); }
  Slab const slab = MakeSlab(map, opts.depthSamples);
  Re1        I(det.shape[0]);
  bool       hit = false;
  ProjectInto(map, g, beam, det, slab, v, I.data(), hit);
  if (!hit) { throw ProjectionError("Detector line {} at angle {} does not sample inside the map", v, g.angle); }
  return I;
}

} // namespace xr
