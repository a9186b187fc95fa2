#include "xr/errors.hpp"
#include "xr/phantom/breast.hpp"
#include "xr/tensors.hpp"
#include "xr/xray/projector.hpp"
#include "xr/xray/simulate.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace xr;
using namespace Catch;

namespace {
auto SmallPhantom() -> PhantomOptions
{
  PhantomOptions opts;
  opts.matrix = Sz2{64, 64};
  return opts;
}

auto SmallDetector() -> Detector
{
  Detector det;
  det.shape = Sz2{64, 64};
  det.pitch = 1.6f;
  return det;
}
} // namespace

TEST_CASE("Project", "[proj]")
{
  auto const phantom = BreastPhantom(SmallPhantom());
  auto const det = SmallDetector();
  auto const geom = MakeGeometry(500.f, 1000.f, 0.f);
  auto const beam = MakeBeam(30.f, 1.f, 2.f, false);
  auto const I = Project(phantom.map, geom, beam, det);

  SECTION("Range")
  {
    CHECK(I.dimension(0) == 64);
    CHECK(I.dimension(1) == 64);
    CHECK(Minimum(I) >= 0.f);
    CHECK(Maximum(I) <= Approx(beam.I0()));
    // Corner rays miss the breast and only see the filter
    CHECK(I(0, 0) == Approx(beam.transmit(0.f)));
    // Tissue attenuates
    CHECK(I(32, 32) < I(0, 0));
  }

  SECTION("Serial matches threaded")
  {
    auto const serial = Project(phantom.map, geom, beam, det, ProjectorOpts{.depthSamples = 32, .threaded = false});
    Re0 const  d = (serial - I).abs().maximum();
    CHECK(d() == 0.f);
  }

  SECTION("Single line")
  {
    for (Index const v : {Index(0), Index(20), Index(32), Index(63)}) {
      auto const line = ProjectLine(phantom.map, geom, beam, det, v);
      for (Index iu = 0; iu < det.shape[0]; iu++) {
        CHECK(line(iu) == I(iu, v));
      }
    }
    CHECK_THROWS_AS(ProjectLine(phantom.map, geom, beam, det, 64), IndexError);
    CHECK_THROWS_AS(ProjectLine(phantom.map, geom, beam, det, -1), IndexError);
  }

  SECTION("Exposure and kVp")
  {
    auto const brighter = Project(phantom.map, geom, MakeBeam(30.f, 2.f, 2.f, false), det);
    CHECK(brighter(32, 32) == Approx(2.f * I(32, 32)));
    CHECK(MakeBeam(40.f, 1.f, 2.f, false).I0() > beam.I0());
    auto const harder = Project(phantom.map, geom, MakeBeam(40.f, 1.f, 2.f, false), det);
    CHECK(harder(32, 32) > I(32, 32));
  }

  SECTION("Grid")
  {
    auto const gridded = Project(phantom.map, geom, MakeBeam(30.f, 1.f, 2.f, true), det);
    CHECK(Mean(gridded) < Mean(I));
    CHECK(gridded(32, 32) == Approx(GridFactor * I(32, 32)));
  }

  SECTION("Compression")
  {
    auto opts = SmallPhantom();
    opts.compression = true;
    auto const squeezed = BreastPhantom(opts);
    auto const Ic = Project(squeezed.map, geom, beam, det);
    CHECK(Mean(Ic) > Mean(I));
    CHECK(Ic(32, 32) > I(32, 32));
  }

  SECTION("Half turn")
  {
    auto const I180 = Project(phantom.map, MakeGeometry(500.f, 1000.f, 180.f), beam, det);
    Index const nu = det.shape[0], nv = det.shape[1];
    float       worst = 0.f;
    for (Index iv = 0; iv < nv; iv++) {
      for (Index iu = 0; iu < nu; iu++) {
        worst = std::max(worst, std::abs(I180(iu, iv) - I(nu - 1 - iu, nv - 1 - iv)));
      }
    }
    CHECK(worst == Approx(0.f).margin(1.e-3f * beam.I0()));
  }

  SECTION("Detector off the map")
  {
    auto far = det;
    far.offset = Eigen::Array2f(10000.f, 0.f);
    CHECK_THROWS_AS(Project(phantom.map, geom, beam, far), ProjectionError);
    CHECK_THROWS_AS(ProjectLine(phantom.map, geom, beam, far, 32), ProjectionError);
  }

  SECTION("Bad detector")
  {
    auto bad = det;
    bad.pitch = 0.f;
    CHECK_THROWS_AS(Project(phantom.map, geom, beam, bad), ParameterError);
    CHECK_THROWS_AS(Project(phantom.map, geom, beam, det, ProjectorOpts{.depthSamples = 0}), ParameterError);
  }
}

TEST_CASE("Simulate", "[proj]")
{
  SimulationRequest req;
  req.phantom = SmallPhantom();
  req.params.detector = SmallDetector();
  req.params.kVp = 35.f;
  req.params.angle = 0.f;

  SECTION("Example acquisition")
  {
    auto const  r = Simulate(req);
    float const I0 = (35.f / 30.f) * (35.f / 30.f);
    CHECK(r.beam.I0() == Approx(I0));
    CHECK(Minimum(r.radiograph) >= 0.f);
    CHECK(Maximum(r.radiograph) <= Approx(I0));
    CHECK(r.geometry.magnification == Approx(2.f));
    CHECK(r.lesionRect.w > 0);
    CHECK(r.lesionRect.w == r.backgroundRect.w);
    CHECK(r.lesion.contrast > 0.f);
    CHECK(r.lesion.mean < r.background.mean);
  }

  SECTION("No lesion")
  {
    req.phantom.lesion = false;
    for (float const a : {0.f, 30.f, 90.f, 135.f}) {
      req.params.angle = a;
      auto const r = Simulate(req);
      INFO("Angle " << a);
      CHECK(r.lesion.contrast == Approx(0.f).margin(2.e-3f));
    }
  }

  SECTION("Denser tissue")
  {
    auto const base = Simulate(req);
    req.muScale = 1.2f;
    auto const dense = Simulate(req);
    CHECK(Mean(dense.radiograph) < Mean(base.radiograph));
  }

  SECTION("Invalid inputs")
  {
    auto bad = req;
    bad.params.sid = 700.f;
    bad.params.sdd = 500.f;
    CHECK_THROWS_AS(Simulate(bad), GeometryError);
    bad = req;
    bad.params.kVp = -1.f;
    CHECK_THROWS_AS(Simulate(bad), ParameterError);
    bad = req;
    bad.muScale = -0.5f;
    CHECK_THROWS_AS(Simulate(bad), ParameterError);
  }
}
