#pragma once

#include "../algo/stats.hpp"
#include "../phantom/breast.hpp"
#include "projector.hpp"

namespace xr {

struct SimulationRequest
{
  AcquisitionParams params;
  PhantomOptions    phantom;
  float             muScale = 1.f;  // Multiplies every attenuation coefficient
  float             roiHalf = -1.f; // mm, negative selects half the lesion radius
};

struct SimulationResult
{
  Phantom  phantom;
  Geometry geometry;
  Beam     beam;
  Re2      radiograph;
  Rect     lesionRect, backgroundRect;
  ROIStat  lesion, background;
};

/*
 * Phantom, projection and ROI statistics for one set of inputs. The background ROI sits on the mirrored landmark so
 * the contrast is measured against the same tissue at the same thickness.
 */
auto Simulate(SimulationRequest const &req) -> SimulationResult;

} // namespace xr
