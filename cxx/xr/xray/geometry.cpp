#include "geometry.hpp"

#include "../errors.hpp"
#include "params.hpp"

#include <cmath>

namespace xr {

auto MakeGeometry(float const sid, float const sdd, float const angle) -> Geometry
{
  if (!std::isfinite(sid) || !std::isfinite(sdd) || !std::isfinite(angle)) {
    throw GeometryError("Non-finite geometry SID {} SDD {} angle {}", sid, sdd, angle);
  }
  if (sid <= 0.f) { throw GeometryError("SID must be positive, was {} mm", sid); }
  if (sdd <= sid) { throw GeometryError("SDD {} mm must be greater than SID {} mm", sdd, sid); }

  float const th = angle * M_PI / 180.;
  Geometry    g{.sid = sid, .sdd = sdd, .angle = angle, .magnification = sdd / sid, .rotation = Eigen::Matrix2f::Identity()};
  g.rotation << std::cos(th), -std::sin(th), //
    std::sin(th), std::cos(th);
  Log::Debug("Geom", "SID {} SDD {} angle {} magnification {}", sid, sdd, angle, g.magnification);
  return g;
}

auto MakeGeometry(AcquisitionParams const &p) -> Geometry { return MakeGeometry(p.sid, p.sdd, p.angle); }

auto Geometry::direction(Point2 const &d) const -> Point3
{
  Point3 const v(d[0], d[1], sdd);
  return v.normalized();
}

auto Geometry::toObject(Point2 const &d, float const z) const -> Point2
{
  return rotation.transpose() * (d * ((z + sid) / sdd));
}

auto Geometry::toDetector(Point2 const &p) const -> Point2 { return (rotation * p) * magnification; }

} // namespace xr
