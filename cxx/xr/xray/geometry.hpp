#pragma once

#include "../types.hpp"

namespace xr {

struct AcquisitionParams;

/*
 * Point source geometry. The source sits sid before the isocentre plane on the beam axis and the detector sdd - sid
 * beyond it. Depths z are measured from the isocentre plane towards the detector. The whole ray set is rotated about
 * the beam axis by angle.
 */
struct Geometry
{
  float           sid, sdd, angle;
  float           magnification;
  Eigen::Matrix2f rotation;

  auto direction(Point2 const &d) const -> Point3;               // Unit ray direction to detector position d (mm)
  auto toObject(Point2 const &d, float const z) const -> Point2; // In-plane object position of the ray to d at depth z
  auto toDetector(Point2 const &p) const -> Point2;              // Detector position of object point p at z = 0
};

auto MakeGeometry(float const sid, float const sdd, float const angle) -> Geometry;
auto MakeGeometry(AcquisitionParams const &p) -> Geometry;

} // namespace xr
