#include "inputs.hpp"
#include "outputs.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"
#include "xr/xray/scenarios.hpp"

#ifdef BUILD_MONTAGE
#include "magick.hpp"

#include <filesystem>

namespace {
void WriteFigures(xr::Scenarios const &sc, std::string const &dir)
{
  using namespace xr;
  Magick::InitializeMagick(NULL);
  std::filesystem::create_directories(dir);
  auto const path = [&dir](std::string const &name) { return (std::filesystem::path(dir) / name).string(); };
  auto const baseline = sc.radiographs.at("baseline");
  auto const w = Window(baseline);
  auto const show = [&](std::string const &key) { return ToMagick(sc.radiographs.at(key), w[0], w[1]); };

  auto const     mu = sc.groundTruth.mu;
  Magick::Image  truth = ToMagick(mu, 0.f, Maximum(mu));
  WritePNG(truth, path("phantom_ground_truth"));
  Magick::Image base = show("baseline");
  WritePNG(base, path("baseline_radiograph"));
  Magick::Image distance = Montage({show("baseline"), show("distance-sid-350"), show("distance-sid-700")});
  WritePNG(distance, path("distance_variation"));
  Magick::Image dense = Montage({show("baseline"), show("mu-dense")});
  WritePNG(dense, path("mu_variation"));
  Magick::Image angles = Montage({show("angle-0"), show("angle-15"), show("angle-30")});
  WritePNG(angles, path("angle_variation"));
  Magick::Image overlays = PlotProfiles({sc.profiles.at("overlay-baseline"), sc.profiles.at("overlay-sid-350"),
                                         sc.profiles.at("overlay-dense"), sc.profiles.at("overlay-angle-20")},
                                        800, 400);
  WritePNG(overlays, path("profile_overlays"));
  Magick::Image compressed =
    PlotProfiles({sc.profiles.at("compressed-baseline"), sc.profiles.at("compressed-compressed")}, 800, 400);
  WritePNG(compressed, path("profile_compressed"));
  auto const    sw = Window(sc.sinogram.data);
  Magick::Image sino = ToMagick(sc.sinogram.data, sw[0], sw[1]);
  WritePNG(sino, path("sinogram"));
}
} // namespace
#endif

using namespace xr;

void main_scenarios(args::Subparser &parser)
{
  args::Positional<std::string> oname(parser, "FILE", "Output file");
  PhantomArgs                   phanArgs(parser);
  SzFlag<2>                     shape(parser, "U,V", "Detector shape (256,256)", {"detector"}, Detector().shape);
  args::ValueFlag<float>        pitch(parser, "P", "Detector pitch in mm (0.8)", {"pitch"}, Detector().pitch);
  args::ValueFlag<float>        step(parser, "S", "Sinogram angle step in degrees (1)", {"step"}, 1.f);
#ifdef BUILD_MONTAGE
  args::ValueFlag<std::string> figs(parser, "DIR", "Write PNG figures to this directory", {"figs"});
#endif
  ParseCommand(parser, oname);
  auto const cmd = parser.GetCommand().Name();

  Detector const det{.shape = shape.Get(), .pitch = pitch.Get(), .offset = Eigen::Array2f::Zero()};
  auto const     sc = RunScenarios(phanArgs.Get(), det, step.Get());

  HD5::Writer writer(oname.Get());
  WriteMap(writer, sc.groundTruth);
  writer.writeStruct(HD5::Keys::Params, BaselineParams(det));
  for (auto const &kv : sc.radiographs) {
    writer.writeTensor(HD5::Keys::Radiograph + "-" + kv.first, HD5::Shape<2>{kv.second.dimension(0), kv.second.dimension(1)},
                       kv.second.data(), HD5::Dims::Radiograph);
  }
  for (auto const &kv : sc.profiles) {
    writer.writeTensor(HD5::Keys::Profile + "-" + kv.first, HD5::Shape<1>{kv.second.dimension(0)}, kv.second.data(),
                       HD5::Dims::Profile);
  }
  writer.writeTensor(HD5::Keys::Sinogram, HD5::Shape<2>{sc.sinogram.data.dimension(0), sc.sinogram.data.dimension(1)},
                     sc.sinogram.data.data(), HD5::Dims::Sinogram);
  writer.writeTensor(HD5::Keys::Angles, HD5::Shape<1>{sc.sinogram.angles.dimension(0)}, sc.sinogram.angles.data(),
                     HD5::Dims::Angles);
  writer.writeMeta(sc.stats);
  WriteLog(writer, cmd, oname.Get());
#ifdef BUILD_MONTAGE
  if (figs) { WriteFigures(sc, figs.Get()); }
#endif
}
