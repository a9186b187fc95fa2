#pragma once

#include "simulate.hpp"
#include "sinogram.hpp"

#include <map>
#include <string>

namespace xr {

struct Scenarios
{
  AttenuationMap                groundTruth;
  std::map<std::string, Re2>    radiographs; // Keyed by panel, e.g. "distance-sid-350"
  std::map<std::string, Re1>    profiles;    // Central detector line, keyed by panel
  Sinogram                      sinogram;
  std::map<std::string, float>  stats;       // Mask statistics of mu and mu * t, radiograph ROI values
};

/*
 * The teaching figure set: baseline radiograph, source distance, attenuation and angle variations, profile
 * overlays, compressed versus baseline profiles and a sinogram, all from the baseline acquisition
 * (SID 500, SDD 1000, 35 kVp, 1 s, 2 mm Al) unless the panel varies it.
 */
auto RunScenarios(PhantomOptions const &phantom, Detector const &det, float const sinoStep) -> Scenarios;

auto BaselineParams(Detector const &det) -> AcquisitionParams;

} // namespace xr
