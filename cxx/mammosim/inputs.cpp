#include "inputs.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"

using namespace xr;

AcquisitionArgs::AcquisitionArgs(args::Subparser &parser)
  : sid(parser, "SID", "Source to isocentre distance in mm (500)", {"sid"}, SliderDefaults.sid.initial)
  , sdd(parser, "SDD", "Source to detector distance in mm (1000)", {"sdd"}, SliderDefaults.sdd.initial)
  , angle(parser, "A", "Beam angle in degrees (30)", {"angle", 'a'}, SliderDefaults.angle.initial)
  , kVp(parser, "K", "Tube voltage in kVp (30)", {"kvp", 'k'}, SliderDefaults.kVp.initial)
  , exposure(parser, "E", "Exposure in s (1)", {"exposure", 'e'}, SliderDefaults.exposure.initial)
  , filtration(parser, "F", "Filtration in mm Al (2)", {"filtration", 'f'}, SliderDefaults.filtration.initial)
  , grid(parser, "G", "Use the anti-scatter grid", {"grid", 'g'})
  , shape(parser, "U,V", "Detector shape (256,256)", {"detector"}, Detector().shape)
  , pitch(parser, "P", "Detector pitch in mm (0.8)", {"pitch"}, Detector().pitch)
  , offset(parser, "X,Y", "Detector offset in mm (0,0)", {"offset"}, Eigen::Array2f::Zero())
  , clamp(parser, "C", "Clamp parameters to the recommended ranges", {"clamp"})
{
}

auto AcquisitionArgs::Get() -> AcquisitionParams
{
  AcquisitionParams p{.sid = sid.Get(),
                      .sdd = sdd.Get(),
                      .angle = angle.Get(),
                      .kVp = kVp.Get(),
                      .exposure = exposure.Get(),
                      .filtration = filtration.Get(),
                      .grid = grid.Get(),
                      .detector = Detector{.shape = shape.Get(), .pitch = pitch.Get(), .offset = offset.Get()}};
  if (clamp) { p = Clamp(p, SliderDefaults); }
  return p;
}

PhantomArgs::PhantomArgs(args::Subparser &parser)
  : matrix(parser, "M", "Phantom matrix (256,256)", {"matrix", 'm'}, PhantomOptions().matrix)
  , spacing(parser, "S", "Phantom pixel spacing in mm (0.8)", {"spacing"}, PhantomOptions().spacing)
  , thickness(parser, "T", "Nominal breast thickness in mm (50)", {"thickness"}, PhantomOptions().thickness)
  , compression(parser, "C", "Compress the breast", {"compress", 'c'})
  , scale(parser, "S", "Thickness scale under compression (0.65)", {"compress-scale"}, SliderDefaults.compression)
  , noLesion(parser, "L", "Leave out the lesion", {"no-lesion"})
  , noCalcs(parser, "C", "Leave out the calcifications", {"no-calcs"})
  , lesion(parser, "X,Y", "Lesion centre in normalised coordinates (0,0.2)", {"lesion"}, Eigen::Array2f(0.f, 0.2f))
  , radius(parser, "R", "Lesion radius in normalised coordinates (0.15)", {"lesion-radius"}, PhantomOptions().lesionRadius)
{
}

auto PhantomArgs::Get() -> PhantomOptions
{
  return PhantomOptions{.matrix = matrix.Get(),
                        .spacing = spacing.Get(),
                        .thickness = thickness.Get(),
                        .compression = compression.Get(),
                        .thicknessScale = scale.Get(),
                        .lesion = !noLesion.Get(),
                        .calcifications = !noCalcs.Get(),
                        .lesionX = lesion.Get()[0],
                        .lesionY = lesion.Get()[1],
                        .lesionRadius = radius.Get()};
}

auto ReadMap(HD5::Reader const &reader) -> AttenuationMap
{
  AttenuationMap map{.mu = reader.readTensor<Re2>(HD5::Keys::Mu),
                     .thickness = reader.readTensor<Re2>(HD5::Keys::Thickness),
                     .info = reader.readStruct<Info>(HD5::Keys::Info)};
  if (map.mu.dimension(0) != map.thickness.dimension(0) || map.mu.dimension(1) != map.thickness.dimension(1)) {
    throw Log::Failure("Map", "Attenuation {} and thickness {} shapes differ", map.mu.dimensions(), map.thickness.dimensions());
  }
  return map;
}
