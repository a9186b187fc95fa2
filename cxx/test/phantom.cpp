#include "xr/errors.hpp"
#include "xr/phantom/breast.hpp"
#include "xr/phantom/shepp-logan.hpp"
#include "xr/tensors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

using namespace xr;
using namespace Catch;

namespace {
auto Small() -> PhantomOptions
{
  PhantomOptions opts;
  opts.matrix = Sz2{64, 64};
  return opts;
}
} // namespace

TEST_CASE("Breast", "[phantom]")
{
  auto const opts = Small();

  SECTION("Deterministic")
  {
    auto const a = BreastPhantom(opts);
    auto const b = BreastPhantom(opts);
    Re0 const  dmu = (a.map.mu - b.map.mu).abs().maximum();
    Re0 const  dt = (a.map.thickness - b.map.thickness).abs().maximum();
    CHECK(dmu() == 0.f);
    CHECK(dt() == 0.f);
  }

  SECTION("Layout")
  {
    auto const p = BreastPhantom(opts);
    CHECK(p.map.matrix()[0] == 64);
    CHECK(p.map.matrix()[1] == 64);
    CHECK(p.map.info.origin[0] == Approx(-31.5f * 0.8f));
    CHECK(p.map.halfExtent()[0] == Approx(32.f * 0.8f));
    // Corners lie outside the silhouette
    CHECK(p.map.mu(0, 0) == 0.f);
    CHECK(p.map.thickness(0, 0) == 0.f);
    CHECK(p.map.mu(63, 63) == 0.f);
    CHECK(Maximum(p.map.mu) == Approx(Tissue::Calcification));
    CHECK(Minimum(p.map.mu) == 0.f);
    CHECK(p.map.maxThickness() <= Approx(opts.thickness));
    CHECK(p.map.maxThickness() > 0.8f * opts.thickness);
  }

  SECTION("Landmarks")
  {
    auto const p = BreastPhantom(opts);
    CHECK(p.landmarks.lesion[0] == Approx(0.f));
    CHECK(p.landmarks.lesion[1] == Approx(0.2f * 31.5f * 0.8f));
    CHECK(p.landmarks.background[1] == Approx(-p.landmarks.lesion[1]));
    Index nLesion = 0, nBackground = 0;
    for (Index ii = 0; ii < p.lesionMask.size(); ii++) {
      nLesion += p.lesionMask.data()[ii];
      nBackground += p.backgroundMask.data()[ii];
      CHECK(!(p.lesionMask.data()[ii] && p.backgroundMask.data()[ii]));
    }
    CHECK(nLesion > 0);
    CHECK(std::abs(nLesion - nBackground) <= 2);
  }

  SECTION("Lesion and calcifications")
  {
    auto const with = BreastPhantom(opts);
    auto       none = opts;
    none.lesion = false;
    none.calcifications = false;
    auto const without = BreastPhantom(none);
    CHECK(Maximum(with.map.mu) > Maximum(without.map.mu));
    CHECK(Maximum(without.map.mu) == Approx(Tissue::Skin));
    CHECK(Mean(with.map.mu) > Mean(without.map.mu));
  }

  SECTION("Compression")
  {
    auto       squeezed = opts;
    squeezed.compression = true;
    auto const a = BreastPhantom(opts);
    auto const b = BreastPhantom(squeezed);
    CHECK(b.map.maxThickness() == Approx(opts.thicknessScale * a.map.maxThickness()));
    Re0 const dmu = (a.map.mu - b.map.mu).abs().maximum();
    CHECK(dmu() == 0.f);
  }

  SECTION("Invalid")
  {
    auto bad = opts;
    bad.compression = true;
    bad.thicknessScale = 0.f;
    CHECK_THROWS_AS(BreastPhantom(bad), ParameterError);
    bad.thicknessScale = 1.5f;
    CHECK_THROWS_AS(BreastPhantom(bad), ParameterError);

    auto outside = opts;
    outside.lesionX = 0.8f;
    outside.lesionY = 0.f;
    CHECK_THROWS_AS(BreastPhantom(outside), Log::Failure);
    outside.lesion = false;
    CHECK_NOTHROW(BreastPhantom(outside));

    auto tiny = opts;
    tiny.matrix = Sz2{1, 64};
    CHECK_THROWS_AS(BreastPhantom(tiny), ParameterError);
  }
}

TEST_CASE("Scaled", "[phantom]")
{
  auto const p = BreastPhantom(Small());
  auto const s = Scaled(p.map, 1.2f);
  CHECK(Maximum(s.mu) == Approx(1.2f * Maximum(p.map.mu)));
  CHECK(Maximum(s.thickness) == Approx(Maximum(p.map.thickness)));
  CHECK_THROWS_AS(Scaled(p.map, -1.f), ParameterError);
}

TEST_CASE("Sample", "[phantom]")
{
  auto const p = BreastPhantom(Small());
  SECTION("Pixel centres")
  {
    Point2 const c(p.map.info.origin[0] + 20 * 0.8f, p.map.info.origin[1] + 30 * 0.8f);
    auto const   s = Sample(p.map, c);
    CHECK(s.mu == Approx(p.map.mu(20, 30)));
    CHECK(s.thickness == Approx(p.map.thickness(20, 30)));
  }
  SECTION("Air outside")
  {
    auto const s = Sample(p.map, Point2(1000.f, 0.f));
    CHECK(s.mu == 0.f);
    CHECK(s.thickness == 0.f);
    CHECK(!p.map.inside(Point2(1000.f, 0.f)));
  }
}

TEST_CASE("SheppLogan", "[phantom]")
{
  auto const m = SheppLogan2D(Sz2{64, 64}, 1.f, 20.f);
  CHECK(m.mu(0, 0) == Approx(0.1f));
  CHECK(m.maxThickness() == Approx(20.f));
  CHECK(Maximum(m.mu) > 0.1f);
}
