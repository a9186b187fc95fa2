#include "magick.hpp"

#include "xr/algo/stats.hpp"
#include "xr/log/log.hpp"
#include "xr/tensors.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <limits>

namespace xr {

auto ToMagick(Re2 const &img, float const lo, float const hi) -> Magick::Image
{
  if (!(hi > lo)) { throw Log::Failure("magick", "Empty display window {} to {}", lo, hi); }
  std::vector<std::uint8_t> grey(img.size());
  for (Index ii = 0; ii < img.size(); ii++) {
    grey[ii] = static_cast<std::uint8_t>(255.f * std::clamp((img.data()[ii] - lo) / (hi - lo), 0.f, 1.f));
  }
  Magick::Image tmp(img.dimension(0), img.dimension(1), "I", Magick::CharPixel, grey.data());
  tmp.flip();
  return tmp;
}

auto Window(Re2 const &img) -> std::array<float, 2>
{
  auto const p = Percentiles(Eigen::Map<Eigen::ArrayXf const>(img.data(), img.size()), {0.01f, 0.99f});
  if (p[1] > p[0]) { return {p[0], p[1]}; }
  return {Minimum(img), Minimum(img) + 1.f};
}

auto PlotProfiles(std::vector<Re1> const &profiles, Index const width, Index const height) -> Magick::Image
{
  std::vector<std::string> const colors{"black", "red", "blue", "green", "orange", "purple"};
  float                           lo = std::numeric_limits<float>::max(), hi = std::numeric_limits<float>::lowest();
  for (auto const &p : profiles) {
    lo = std::min(lo, Minimum(p));
    hi = std::max(hi, Maximum(p));
  }
  if (!(hi > lo)) { hi = lo + 1.f; }

  Magick::Image canvas(Magick::Geometry(width, height), Magick::Color("white"));
  canvas.fillColor(Magick::Color("none"));
  canvas.strokeWidth(2);
  float const margin = 0.05f;
  for (size_t ip = 0; ip < profiles.size(); ip++) {
    auto const            &p = profiles[ip];
    Magick::CoordinateList pts;
    for (Index ii = 0; ii < p.size(); ii++) {
      double const x = width * (margin + (1.f - 2.f * margin) * ii / std::max<Index>(1, p.size() - 1));
      double const y = height * (1.f - margin - (1.f - 2.f * margin) * (p(ii) - lo) / (hi - lo));
      pts.push_back(Magick::Coordinate(x, y));
    }
    canvas.strokeColor(Magick::Color(colors[ip % colors.size()]));
    canvas.draw(Magick::DrawablePolyline(pts));
  }
  return canvas;
}

auto Montage(std::vector<Magick::Image> const &images) -> Magick::Image
{
  if (images.empty()) { throw Log::Failure("magick", "No images to montage"); }
  Magick::Montage montageOpts;
  montageOpts.backgroundColor(Magick::Color(0, 0, 0));
  montageOpts.tile(Magick::Geometry(images.size(), 1));
  montageOpts.geometry(images.front().size());
  std::vector<Magick::Image> tiles = images, frames;
  Magick::montageImages(&frames, tiles.begin(), tiles.end(), montageOpts);
  return frames.front();
}

void WritePNG(Magick::Image &img, std::string const &fname)
{
  auto const p = std::filesystem::path(fname).replace_extension(".png");
  img.magick("PNG");
  img.write(p.string());
  Log::Print("magick", "Wrote {}", p.string());
}

} // namespace xr
