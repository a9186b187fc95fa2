#pragma once

#include "map.hpp"

namespace xr {

struct PhantomOptions
{
  Sz2   matrix{256, 256};
  float spacing = 0.8f;    // mm
  float thickness = 50.f;  // Nominal uncompressed thickness, mm
  bool  compression = false;
  float thicknessScale = 0.65f;
  bool  lesion = true;
  bool  calcifications = true;
  float lesionX = 0.f, lesionY = 0.2f, lesionRadius = 0.15f; // Normalised coordinates
};

/*
 * Positions in mm from the isocentre. The background centre mirrors the lesion across the x axis so that it sits in
 * the same tissue at the same thickness.
 */
struct Landmarks
{
  Point2 lesion;
  float  lesionRadius;
  Point2 background;
};

struct Phantom
{
  AttenuationMap map;
  Landmarks      landmarks;
  B2             lesionMask, backgroundMask;
};

namespace Tissue {
float constexpr Adipose = 0.22f;
float constexpr Gland = 0.40f;
float constexpr Muscle = 0.50f;
float constexpr Skin = 0.80f;
float constexpr Benign = 0.475f;
float constexpr Lesion = 0.75f;
float constexpr Calcification = 1.5f;
} // namespace Tissue

auto BreastPhantom(PhantomOptions const &opts) -> Phantom;

} // namespace xr
