#pragma once

#include "projector.hpp"

namespace xr {

struct Reduction
{
  enum struct Type
  {
    Line = 0, // One detector line
    Mean      // Mean over the detector lines, so every feature contributes to every row
  };
  Type  type = Type::Mean;
  Index line = -1; // Line reduction only, negative selects the central line nv / 2
};

struct Sinogram
{
  Re2 data;   // (nAngles, nu), row k is angle k * step
  Re1 angles; // degrees
};

auto SinogramAngles(float const step) -> Re1;

/*
 * Projects the map at angles 0, step, 2 step... below 180 degrees using the SID and SDD of geom and stacks the
 * reduced projections by angle. Angles run in parallel and each writes only its own row.
 */
auto BuildSinogram(AttenuationMap const &map,
                   Geometry const       &geom,
                   Beam const           &beam,
                   Detector const       &det,
                   float const           step,
                   Reduction const      &reduction = Reduction(),
                   Index const           depthSamples = ProjectorOpts().depthSamples) -> Sinogram;

} // namespace xr
