#include "xr/tensors.hpp"
#include "xr/xray/scenarios.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace xr;
using namespace Catch;

TEST_CASE("Scenarios", "[scen]")
{
  PhantomOptions popts;
  popts.matrix = Sz2{48, 48};
  Detector det;
  det.shape = Sz2{48, 48};
  det.pitch = 1.6f;

  auto const base = BaselineParams(det);
  CHECK(base.sid == Approx(500.f));
  CHECK(base.sdd == Approx(1000.f));
  CHECK(base.kVp == Approx(35.f));
  CHECK(base.filtration == Approx(2.f));
  CHECK(!base.grid);

  auto const sc = RunScenarios(popts, det, 30.f);

  SECTION("Keys")
  {
    for (auto const key :
         {"baseline", "distance-sid-350", "distance-sid-700", "mu-dense", "angle-0", "angle-15", "angle-30"}) {
      INFO(key);
      REQUIRE(sc.radiographs.contains(key));
      CHECK(sc.radiographs.at(key).dimension(0) == 48);
    }
    for (auto const key : {"overlay-baseline", "overlay-sid-350", "overlay-dense", "overlay-angle-20", "compressed-baseline",
                           "compressed-compressed"}) {
      INFO(key);
      REQUIRE(sc.profiles.contains(key));
      CHECK(sc.profiles.at(key).size() == 48);
    }
    for (auto const prefix : {"mu_baseline", "mut_baseline", "mut_compressed", "radiograph_lesion"}) {
      for (auto const suffix : {"_mean", "_std", "_contrast"}) {
        INFO(prefix << suffix);
        CHECK(sc.stats.contains(std::string(prefix) + suffix));
      }
    }
    CHECK(sc.groundTruth.matrix()[0] == 48);
  }

  SECTION("Variations")
  {
    auto const &baseline = sc.radiographs.at("baseline");
    CHECK(Mean(sc.radiographs.at("mu-dense")) < Mean(baseline));
    Re0 const d = (sc.radiographs.at("distance-sid-350") - baseline).abs().maximum();
    CHECK(d() > 0.f);
    Re0 const a = (sc.radiographs.at("angle-0") - baseline).abs().maximum();
    CHECK(a() == 0.f);
    CHECK(Mean(sc.profiles.at("compressed-compressed")) > Mean(sc.profiles.at("compressed-baseline")));
    CHECK(sc.stats.at("radiograph_lesion_contrast") > 0.f);
  }

  SECTION("Compression statistics")
  {
    CHECK(sc.stats.at("mut_compressed_mean") == Approx(popts.thicknessScale * sc.stats.at("mut_baseline_mean")));
    CHECK(sc.stats.at("mut_compressed_mean") < sc.stats.at("mut_baseline_mean"));
  }

  SECTION("Sinogram")
  {
    CHECK(sc.sinogram.data.dimension(0) == SinogramAngles(30.f).size());
    CHECK(sc.sinogram.data.dimension(0) == 6);
    CHECK(sc.sinogram.data.dimension(1) == 48);
  }
}
