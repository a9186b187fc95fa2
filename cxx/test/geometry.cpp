#include "xr/errors.hpp"
#include "xr/xray/beam.hpp"
#include "xr/xray/geometry.hpp"
#include "xr/xray/params.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace xr;
using namespace Catch;

TEST_CASE("Geometry", "[geom]")
{
  SECTION("Magnification")
  {
    auto const g = MakeGeometry(500.f, 1000.f, 0.f);
    CHECK(g.magnification == Approx(2.f));
    Point2 const d = g.toDetector(Point2(10.f, -5.f));
    CHECK(d[0] == Approx(20.f));
    CHECK(d[1] == Approx(-10.f));
  }

  SECTION("Round trip at the isocentre")
  {
    auto const   g = MakeGeometry(600.f, 900.f, 30.f);
    Point2 const p(12.f, 7.f);
    Point2 const back = g.toObject(g.toDetector(p), 0.f);
    CHECK(back[0] == Approx(p[0]).margin(1.e-4f));
    CHECK(back[1] == Approx(p[1]).margin(1.e-4f));
  }

  SECTION("Central ray")
  {
    auto const   g = MakeGeometry(500.f, 1000.f, 45.f);
    Point3 const dir = g.direction(Point2::Zero());
    CHECK(dir[2] == Approx(1.f));
    Point3 const edge = g.direction(Point2(1000.f, 0.f));
    CHECK(edge[2] == Approx(1.f / std::sqrt(2.f)));
  }

  SECTION("Invalid")
  {
    CHECK_THROWS_AS(MakeGeometry(700.f, 500.f, 0.f), GeometryError);
    CHECK_THROWS_AS(MakeGeometry(0.f, 1000.f, 0.f), GeometryError);
    CHECK_THROWS_AS(MakeGeometry(500.f, 500.f, 0.f), GeometryError);
    CHECK_THROWS_AS(MakeGeometry(std::numeric_limits<float>::quiet_NaN(), 1000.f, 0.f), GeometryError);
    CHECK_THROWS_AS(MakeGeometry(500.f, 1000.f, std::numeric_limits<float>::infinity()), GeometryError);
  }
}

TEST_CASE("Beam", "[beam]")
{
  SECTION("Incident intensity")
  {
    CHECK(MakeBeam(30.f, 1.f, 0.f, false).I0() == Approx(1.f));
    CHECK(MakeBeam(60.f, 1.f, 0.f, false).I0() == Approx(4.f));
    CHECK(MakeBeam(30.f, 2.5f, 0.f, false).I0() == Approx(2.5f));
    CHECK(MakeBeam(40.f, 1.f, 0.f, false).I0() > MakeBeam(35.f, 1.f, 0.f, false).I0());
  }

  SECTION("Attenuation")
  {
    auto const b = MakeBeam(30.f, 1.f, 2.f, false);
    CHECK(b.attenuation(0.f) == Approx(0.3f));
    CHECK(b.attenuation(1.f) == Approx(1.3f));
    auto const hard = MakeBeam(60.f, 1.f, 2.f, false);
    CHECK(hard.attenuation(1.f) == Approx(0.65f));
    CHECK(b.transmit(1.f) == Approx(std::exp(-1.3f)));
  }

  SECTION("Grid")
  {
    auto const open = MakeBeam(35.f, 1.f, 2.f, false);
    auto const grid = MakeBeam(35.f, 1.f, 2.f, true);
    CHECK(grid.gain() == Approx(GridFactor));
    CHECK(grid.transmit(0.5f) == Approx(GridFactor * open.transmit(0.5f)));
  }

  SECTION("Invalid")
  {
    CHECK_THROWS_AS(MakeBeam(0.f, 1.f, 2.f, false), ParameterError);
    CHECK_THROWS_AS(MakeBeam(-30.f, 1.f, 2.f, false), ParameterError);
    CHECK_THROWS_AS(MakeBeam(30.f, 0.f, 2.f, false), ParameterError);
    CHECK_THROWS_AS(MakeBeam(30.f, 1.f, -1.f, false), ParameterError);
  }
}

TEST_CASE("Parameters", "[pars]")
{
  Defaults const d;
  auto const     p = Initial(d);
  CHECK(p.angle == Approx(30.f));
  CHECK(p.sid == Approx(500.f));
  CHECK(p.kVp == Approx(30.f));

  AcquisitionParams wild = p;
  wild.kVp = 500.f;
  wild.exposure = -1.f;
  auto const c = Clamp(wild, d);
  CHECK(c.kVp == Approx(d.kVp.hi));
  CHECK(c.exposure == Approx(d.exposure.lo));
}
