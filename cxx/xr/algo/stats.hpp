#pragma once

#include "../types.hpp"

#include <map>
#include <string>

// Profile and region statistics

namespace xr {

struct Detector;
struct Geometry;

struct Rect
{
  Index x, y, w, h; // Start along axis 0, start along axis 1, extents
};

struct ROIStat
{
  float mean, std, contrast;
};

auto ExtractProfile(Re2 const &img, Index const axis, Index const index) -> Re1;

auto ROIStats(Re2 const &img, Rect const &roi, Rect const &background) -> ROIStat;
auto ROIStats(Re2 const &img, B2 const &roi, B2 const &background) -> ROIStat;

/*
 * Detector rectangle covering the square of half-width half (mm) around the object point centre (mm) at the
 * isocentre plane. Clipped to the detector.
 */
auto RectAround(Geometry const &geom, Detector const &det, Point2 const &centre, float const half) -> Rect;

/*
 * Stores mean, std and contrast under prefix_mean, prefix_std and prefix_contrast.
 */
void AddStats(std::map<std::string, float> &meta, std::string const &prefix, ROIStat const &s);

auto Percentiles(Eigen::ArrayXf const &vals, std::vector<float> const &p) -> std::vector<float>;

} // namespace xr
