#pragma once

#include "xr/types.hpp"

#include "Magick++.h"

#include <array>
#include <string>
#include <vector>

namespace xr {

auto ToMagick(Re2 const &img, float const lo, float const hi) -> Magick::Image;
auto Window(Re2 const &img) -> std::array<float, 2>; // 1st and 99th percentiles
auto PlotProfiles(std::vector<Re1> const &profiles, Index const width, Index const height) -> Magick::Image;
auto Montage(std::vector<Magick::Image> const &images) -> Magick::Image;
void WritePNG(Magick::Image &img, std::string const &fname);

} // namespace xr
