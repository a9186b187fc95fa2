#include "xr/algo/stats.hpp"
#include "xr/errors.hpp"
#include "xr/xray/geometry.hpp"
#include "xr/xray/params.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>

using namespace xr;
using namespace Catch;

TEST_CASE("Profiles", "[stats]")
{
  Re2 img(4, 3);
  for (Index ij = 0; ij < 3; ij++) {
    for (Index ii = 0; ii < 4; ii++) {
      img(ii, ij) = 10.f * ij + ii;
    }
  }

  SECTION("Along axis 0")
  {
    auto const p = ExtractProfile(img, 0, 2);
    REQUIRE(p.size() == 4);
    CHECK(p(0) == Approx(20.f));
    CHECK(p(3) == Approx(23.f));
  }

  SECTION("Along axis 1")
  {
    auto const p = ExtractProfile(img, 1, 1);
    REQUIRE(p.size() == 3);
    CHECK(p(0) == Approx(1.f));
    CHECK(p(2) == Approx(21.f));
  }

  SECTION("Out of range")
  {
    CHECK_THROWS_AS(ExtractProfile(img, 0, 3), IndexError);
    CHECK_THROWS_AS(ExtractProfile(img, 1, 4), IndexError);
    CHECK_THROWS_AS(ExtractProfile(img, 0, -1), IndexError);
    CHECK_THROWS_AS(ExtractProfile(img, 2, 0), IndexError);
  }
}

TEST_CASE("ROI", "[stats]")
{
  Re2 img(8, 8);
  img.setConstant(2.f);
  img(1, 1) = 1.f;
  img(2, 1) = 3.f;
  img(1, 2) = 1.f;
  img(2, 2) = 3.f;

  SECTION("Rectangles")
  {
    auto const s = ROIStats(img, Rect{1, 1, 2, 2}, Rect{5, 5, 2, 2});
    CHECK(s.mean == Approx(2.f));
    CHECK(s.std == Approx(1.f));
    CHECK(s.contrast == Approx(0.f).margin(1.e-6f));

    img(6, 6) = 6.f;
    auto const t = ROIStats(img, Rect{0, 0, 1, 1}, Rect{5, 5, 2, 2});
    CHECK(t.mean == Approx(2.f));
    CHECK(t.std == Approx(0.f).margin(1.e-6f));
    CHECK(t.contrast == Approx(1.f / 3.f));
  }

  SECTION("Masks")
  {
    B2 roi(8, 8), bg(8, 8);
    roi.setConstant(false);
    bg.setConstant(false);
    roi(2, 1) = true;
    roi(2, 2) = true;
    bg(5, 5) = true;
    auto const s = ROIStats(img, roi, bg);
    CHECK(s.mean == Approx(3.f));
    CHECK(s.contrast == Approx(0.5f));

    B2 empty(8, 8);
    empty.setConstant(false);
    CHECK_THROWS_AS(ROIStats(img, empty, bg), IndexError);
    B2 wrong(4, 4);
    wrong.setConstant(true);
    CHECK_THROWS_AS(ROIStats(img, wrong, bg), IndexError);
  }

  SECTION("Invalid rectangles")
  {
    CHECK_THROWS_AS(ROIStats(img, Rect{7, 7, 2, 2}, Rect{0, 0, 2, 2}), IndexError);
    CHECK_THROWS_AS(ROIStats(img, Rect{0, 0, 0, 2}, Rect{0, 0, 2, 2}), IndexError);
    CHECK_THROWS_AS(ROIStats(img, Rect{0, 0, 2, 2}, Rect{-1, 0, 2, 2}), IndexError);
  }

  SECTION("Zero background")
  {
    Re2 dark(4, 4);
    dark.setZero();
    CHECK_THROWS_AS(ROIStats(dark, Rect{0, 0, 2, 2}, Rect{2, 2, 2, 2}), DivideByZeroError);
  }
}

TEST_CASE("RectAround", "[stats]")
{
  Detector det;
  det.shape = Sz2{64, 64};
  det.pitch = 1.f;
  auto const g = MakeGeometry(500.f, 1000.f, 0.f);

  SECTION("Centred")
  {
    auto const r = RectAround(g, det, Point2::Zero(), 2.f);
    CHECK(r.w == r.h);
    CHECK(r.x + r.w / 2 == 32);
    CHECK(r.w == 9);
  }

  SECTION("Clipped")
  {
    auto const r = RectAround(g, det, Point2(15.f, 0.f), 4.f);
    CHECK(r.x + r.w == 64);
    CHECK(r.w < r.h);
  }

  SECTION("Outside")
  {
    CHECK_THROWS_AS(RectAround(g, det, Point2(500.f, 0.f), 2.f), IndexError);
    CHECK_THROWS_AS(RectAround(g, det, Point2::Zero(), 0.f), IndexError);
  }
}

TEST_CASE("Percentiles", "[stats]")
{
  Eigen::ArrayXf const x = Eigen::ArrayXf::LinSpaced(101, 0.f, 100.f);
  auto const           p = Percentiles(x, {0.f, 0.5f, 1.f});
  CHECK(p[0] == Approx(0.f));
  CHECK(p[1] == Approx(50.f));
  CHECK(p[2] == Approx(100.f));
  CHECK_THROWS_AS(Percentiles(x, {1.5f}), Log::Failure);
  CHECK_THROWS_AS(Percentiles(Eigen::ArrayXf(), {0.5f}), Log::Failure);

  std::map<std::string, float> meta;
  AddStats(meta, "lesion", ROIStat{.mean = 1.f, .std = 0.1f, .contrast = 0.2f});
  CHECK(meta.at("lesion_mean") == Approx(1.f));
  CHECK(meta.at("lesion_contrast") == Approx(0.2f));
}
