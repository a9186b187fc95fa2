#include "simulate.hpp"

#include "../log/log.hpp"

namespace xr {

auto Simulate(SimulationRequest const &req) -> SimulationResult
{
  auto const t0 = Log::Now();
  // Reject bad acquisition inputs before building the phantom
  Geometry const g = MakeGeometry(req.params);
  Beam const     beam = MakeBeam(req.params);
  CheckDetector(req.params.detector);

  Phantom phantom = BreastPhantom(req.phantom);
  if (req.muScale != 1.f) { phantom.map = Scaled(phantom.map, req.muScale); }
  Re2 radiograph = Project(phantom.map, g, beam, req.params.detector);

  float const half = req.roiHalf > 0.f ? req.roiHalf : 0.5f * phantom.landmarks.lesionRadius;
  Rect const  lesionRect = RectAround(g, req.params.detector, phantom.landmarks.lesion, half);
  Rect const  bgRect = RectAround(g, req.params.detector, phantom.landmarks.background, half);
  auto const  atEdge = [&det = req.params.detector](Rect const &r) {
    return r.x == 0 || r.y == 0 || r.x + r.w == det.shape[0] || r.y + r.h == det.shape[1];
  };
  if (atEdge(lesionRect) || atEdge(bgRect)) { Log::Warn("Sim", "ROIs reach the detector edge and may be clipped"); }
  ROIStat const lesion = ROIStats(radiograph, lesionRect, bgRect);
  ROIStat const bg = ROIStats(radiograph, bgRect, bgRect);
  Log::Print("Sim", "I0 {} lesion {}±{} background {}±{} contrast {} in {}", beam.I0(), lesion.mean, lesion.std, bg.mean,
             bg.std, lesion.contrast, Log::ToNow(t0));
  return SimulationResult{.phantom = std::move(phantom),
                          .geometry = g,
                          .beam = beam,
                          .radiograph = std::move(radiograph),
                          .lesionRect = lesionRect,
                          .backgroundRect = bgRect,
                          .lesion = lesion,
                          .background = bg};
}

} // namespace xr
