#include "xr/errors.hpp"
#include "xr/phantom/breast.hpp"
#include "xr/phantom/shepp-logan.hpp"
#include "xr/sys/threads.hpp"
#include "xr/tensors.hpp"
#include "xr/xray/sinogram.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cmath>

using namespace xr;
using namespace Catch;

TEST_CASE("Sinogram", "[sino]")
{
  PhantomOptions popts;
  popts.matrix = Sz2{48, 48};
  auto const phantom = BreastPhantom(popts);
  Detector   det;
  det.shape = Sz2{48, 16};
  det.pitch = 1.6f;
  auto const geom = MakeGeometry(500.f, 1000.f, 0.f);
  auto const beam = MakeBeam(30.f, 1.f, 2.f, false);

  SECTION("Angles")
  {
    CHECK(SinogramAngles(1.f).size() == 180);
    CHECK(SinogramAngles(7.f).size() == 26);
    CHECK(SinogramAngles(180.f).size() == 1);
    auto const a = SinogramAngles(45.f);
    REQUIRE(a.size() == 4);
    CHECK(a(3) == Approx(135.f));
    CHECK_THROWS_AS(SinogramAngles(0.f), ParameterError);
    CHECK_THROWS_AS(SinogramAngles(-5.f), ParameterError);
  }

  SECTION("Central line")
  {
    auto const sino = BuildSinogram(phantom.map, geom, beam, det, 15.f, Reduction{.type = Reduction::Type::Line});
    REQUIRE(sino.data.dimension(0) == 12);
    REQUIRE(sino.data.dimension(1) == 48);
    CHECK(sino.angles(1) == Approx(15.f));
    for (Index const ia : {Index(0), Index(5)}) {
      auto const line = ProjectLine(phantom.map, MakeGeometry(500.f, 1000.f, ia * 15.f), beam, det, det.shape[1] / 2);
      for (Index iu = 0; iu < det.shape[0]; iu++) {
        CHECK(sino.data(ia, iu) == line(iu));
      }
    }
  }

  SECTION("Thread count does not change the result")
  {
    Threads::SetGlobalThreadCount(1);
    auto const a = BuildSinogram(phantom.map, geom, beam, det, 20.f);
    Threads::SetGlobalThreadCount(4);
    auto const b = BuildSinogram(phantom.map, geom, beam, det, 20.f);
    auto const c = BuildSinogram(phantom.map, geom, beam, det, 20.f);
    Re0 const  dab = (a.data - b.data).abs().maximum();
    Re0 const  dbc = (b.data - c.data).abs().maximum();
    CHECK(dab() == 0.f);
    CHECK(dbc() == 0.f);
    Threads::SetGlobalThreadCount(0);
  }

  SECTION("Mean reduction")
  {
    auto const sino = BuildSinogram(phantom.map, geom, beam, det, 90.f, Reduction{.type = Reduction::Type::Mean});
    REQUIRE(sino.data.dimension(0) == 2);
    auto const I = Project(phantom.map, geom, beam, det);
    for (Index iu = 0; iu < det.shape[0]; iu += 7) {
      float sum = 0.f;
      for (Index iv = 0; iv < det.shape[1]; iv++) {
        sum += I(iu, iv);
      }
      CHECK(sino.data(0, iu) == Approx(sum / det.shape[1]));
    }
  }

  SECTION("Chosen line")
  {
    auto const sino = BuildSinogram(phantom.map, geom, beam, det, 90.f, Reduction{.type = Reduction::Type::Line, .line = 3});
    auto const line = ProjectLine(phantom.map, geom, beam, det, 3);
    CHECK(sino.data(0, 10) == line(10));
    CHECK_THROWS_AS(BuildSinogram(phantom.map, geom, beam, det, 90.f, Reduction{.type = Reduction::Type::Line, .line = 16}), IndexError);
  }

  SECTION("Off-centre features reach every row")
  {
    PhantomOptions plain = popts;
    plain.matrix = Sz2{64, 64};
    plain.lesion = false;
    plain.calcifications = false;
    PhantomOptions calcs = plain;
    calcs.calcifications = true;
    Detector wide;
    wide.shape = Sz2{64, 64};
    wide.pitch = 1.6f;
    auto const a = BuildSinogram(BreastPhantom(plain).map, geom, beam, wide, 10.f);
    auto const b = BuildSinogram(BreastPhantom(calcs).map, geom, beam, wide, 10.f);
    REQUIRE(a.data.dimension(0) == 18);
    for (Index ia = 0; ia < a.data.dimension(0); ia++) {
      float diff = 0.f;
      for (Index iu = 0; iu < a.data.dimension(1); iu++) {
        diff = std::max(diff, std::abs(a.data(ia, iu) - b.data(ia, iu)));
      }
      INFO("Angle " << a.angles(ia));
      CHECK(diff > 1.e-4f);
    }
  }

  SECTION("Invalid step")
  {
    CHECK_THROWS_AS(BuildSinogram(phantom.map, geom, beam, det, 0.f), ParameterError);
    CHECK_THROWS_AS(BuildSinogram(phantom.map, geom, beam, det, 200.f), ParameterError);
  }

  SECTION("Head phantom")
  {
    auto const head = SheppLogan2D(Sz2{48, 48}, 0.8f, 30.f);
    auto const sino = BuildSinogram(head, geom, beam, det, 30.f);
    CHECK(sino.data.dimension(0) == 6);
    CHECK(Minimum(sino.data) >= 0.f);
    CHECK(Maximum(sino.data) <= Approx(beam.I0()));
  }
}
