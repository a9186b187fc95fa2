#pragma once

#include "../phantom/map.hpp"
#include "beam.hpp"
#include "geometry.hpp"
#include "params.hpp"

namespace xr {

struct ProjectorOpts
{
  Index depthSamples = 32; // Depth bins across the thickest part of the map
  bool  threaded = true;   // Split detector lines across the global thread pool
};

/*
 * Simulated radiograph, shape (nu, nv). Each detector pixel integrates mu along the divergent ray from the source
 * through the slab described by the map, then applies the beam model. Values lie in [0, I0].
 */
auto Project(AttenuationMap const &map,
             Geometry const       &geom,
             Beam const           &beam,
             Detector const       &det,
             ProjectorOpts const  &opts = ProjectorOpts()) -> Re2;

/*
 * The single detector line I(:, v), computed with exactly the same arithmetic as Project.
 */
auto ProjectLine(AttenuationMap const &map,
                 Geometry const       &geom,
                 Beam const           &beam,
                 Detector const       &det,
                 Index const           v,
                 ProjectorOpts const  &opts = ProjectorOpts()) -> Re1;

auto DetectorPosition(Detector const &det, Index const iu, Index const iv) -> Point2;
void CheckDetector(Detector const &det);

} // namespace xr
