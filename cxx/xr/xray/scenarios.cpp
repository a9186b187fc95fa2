#include "scenarios.hpp"

#include "../log/log.hpp"

namespace xr {

auto BaselineParams(Detector const &det) -> AcquisitionParams
{
  AcquisitionParams p;
  p.sid = 500.f;
  p.sdd = 1000.f;
  p.angle = 0.f;
  p.kVp = 35.f;
  p.exposure = 1.f;
  p.filtration = 2.f;
  p.grid = false;
  p.detector = det;
  return p;
}

namespace {
auto CentralLine(Re2 const &I) -> Re1 { return ExtractProfile(I, 0, I.dimension(1) / 2); }
} // namespace

auto RunScenarios(PhantomOptions const &phantomOpts, Detector const &det, float const sinoStep) -> Scenarios
{
  Scenarios   sc;
  auto const  base = BaselineParams(det);
  Beam const  beam = MakeBeam(base);
  auto const  phantom = BreastPhantom(phantomOpts);
  auto const  dense = Scaled(phantom.map, 1.2f);
  auto        compOpts = phantomOpts;
  compOpts.compression = true;
  auto const compressed = BreastPhantom(compOpts);
  sc.groundTruth = phantom.map;

  auto const project = [&](AttenuationMap const &map, float const sid, float const angle) {
    return Project(map, MakeGeometry(sid, base.sdd, angle), beam, det);
  };

  Log::Print("Scen", "Baseline and distance variation");
  Re2 const baseline = project(phantom.map, base.sid, 0.f);
  sc.radiographs["baseline"] = baseline;
  sc.radiographs["distance-sid-350"] = project(phantom.map, 350.f, 0.f);
  sc.radiographs["distance-sid-700"] = project(phantom.map, 700.f, 0.f);

  Log::Print("Scen", "Attenuation variation");
  sc.radiographs["mu-dense"] = project(dense, base.sid, 0.f);

  Log::Print("Scen", "Angle variation");
  for (float const a : {0.f, 15.f, 30.f}) {
    sc.radiographs[fmt::format("angle-{:.0f}", a)] = project(phantom.map, base.sid, a);
  }

  Log::Print("Scen", "Profiles");
  sc.profiles["overlay-baseline"] = CentralLine(baseline);
  sc.profiles["overlay-sid-350"] = CentralLine(sc.radiographs["distance-sid-350"]);
  sc.profiles["overlay-dense"] = CentralLine(sc.radiographs["mu-dense"]);
  sc.profiles["overlay-angle-20"] = CentralLine(project(phantom.map, base.sid, 20.f));
  sc.profiles["compressed-baseline"] = sc.profiles["overlay-baseline"];
  sc.profiles["compressed-compressed"] = CentralLine(project(compressed.map, base.sid, 0.f));

  Log::Print("Scen", "Sinogram");
  sc.sinogram = BuildSinogram(phantom.map, MakeGeometry(base), beam, det, sinoStep, Reduction{.type = Reduction::Type::Mean});

  AddStats(sc.stats, "mu_baseline", ROIStats(phantom.map.mu, phantom.lesionMask, phantom.backgroundMask));
  // Compression leaves mu alone, so compare the attenuation path mu * t (mm to cm) instead
  Re2 const pathBase = phantom.map.mu * phantom.map.thickness * 0.1f;
  Re2 const pathComp = compressed.map.mu * compressed.map.thickness * 0.1f;
  AddStats(sc.stats, "mut_baseline", ROIStats(pathBase, phantom.lesionMask, phantom.backgroundMask));
  AddStats(sc.stats, "mut_compressed", ROIStats(pathComp, compressed.lesionMask, compressed.backgroundMask));
  auto const g = MakeGeometry(base);
  float const half = 0.5f * phantom.landmarks.lesionRadius;
  auto const  lesionRect = RectAround(g, det, phantom.landmarks.lesion, half);
  auto const  bgRect = RectAround(g, det, phantom.landmarks.background, half);
  AddStats(sc.stats, "radiograph_lesion", ROIStats(baseline, lesionRect, bgRect));
  for (auto const &kv : sc.stats) {
    Log::Print("Scen", "{} {}", kv.first, kv.second);
  }
  return sc;
}

} // namespace xr
