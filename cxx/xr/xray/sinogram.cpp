#include "sinogram.hpp"

#include "../errors.hpp"
#include "../log/debug.hpp"
#include "../sys/threads.hpp"

#include <cmath>

namespace xr {

auto SinogramAngles(float const step) -> Re1
{
  if (!std::isfinite(step) || step <= 0.f || step > 180.f) { throw ParameterError("Angle step must be in (0, 180], was {}", step); }
  Index n = 0;
  while (n * step < 180.f) {
    n++;
  }
  Re1 angles(n);
  for (Index ii = 0; ii < n; ii++) {
    angles(ii) = ii * step;
  }
  return angles;
}

auto BuildSinogram(AttenuationMap const &map,
                   Geometry const       &geom,
                   Beam const           &beam,
                   Detector const       &det,
                   float const           step,
                   Reduction const      &reduction,
                   Index const           depthSamples) -> Sinogram
{
  CheckDetector(det);
  Index const line = reduction.line < 0 ? det.shape[1] / 2 : reduction.line;
  if (reduction.type == Reduction::Type::Line && line >= det.shape[1]) {
    throw IndexError("Sinogram line {} outside detector with {} lines", line, det.shape[1]);
  }

  Sinogram sino;
  sino.angles = SinogramAngles(step);
  Index const nA = sino.angles.size();
  Index const nu = det.shape[0];
  sino.data.resize(nA, nu);
  Log::Print("Sino", "{} angles step {} reduction {}", nA, step,
             reduction.type == Reduction::Type::Mean ? std::string("mean") : fmt::format("line {}", line));

  ProjectorOpts const opts{.depthSamples = depthSamples, .threaded = false};
  auto const          angle = [&](Index const ia) {
    Geometry const g = MakeGeometry(geom.sid, geom.sdd, sino.angles(ia));
    if (reduction.type == Reduction::Type::Line) {
      Re1 const I = ProjectLine(map, g, beam, det, line, opts);
      for (Index iu = 0; iu < nu; iu++) {
        sino.data(ia, iu) = I(iu);
      }
    } else {
      Re2 const I = Project(map, g, beam, det, opts);
      for (Index iu = 0; iu < nu; iu++) {
        float sum = 0.f;
        for (Index iv = 0; iv < det.shape[1]; iv++) {
          sum += I(iu, iv);
        }
        sino.data(ia, iu) = sum / det.shape[1];
      }
    }
  };
  Threads::For(angle, nA, "Sinogram");
  Log::Tensor("sinogram", HD5::Shape<2>{nA, nu}, sino.data.data(), HD5::Dims::Sinogram);
  return sino;
}

} // namespace xr
