#include "inputs.hpp"
#include "outputs.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"
#include "xr/xray/sinogram.hpp"

using namespace xr;

void main_sinogram(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input phantom file");
  args::Positional<std::string> oname(parser, "FILE", "Output sinogram file");
  AcquisitionArgs               acqArgs(parser);
  args::ValueFlag<float>        step(parser, "S", "Angle step in degrees (1)", {"step"}, 1.f);
  args::ValueFlag<Index>        line(parser, "L", "Take one detector line instead of the mean over lines", {"line"}, -1);
  args::Flag                    central(parser, "C", "Take the central detector line", {"central"});
  args::ValueFlag<Index>        depth(parser, "N", "Depth samples per ray (32)", {"depth"}, ProjectorOpts().depthSamples);
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  HD5::Reader reader(iname.Get());
  auto const  map = ReadMap(reader);
  auto const  pars = acqArgs.Get();
  Reduction const r{.type = (line || central) ? Reduction::Type::Line : Reduction::Type::Mean, .line = line.Get()};
  auto const      sino = BuildSinogram(map, MakeGeometry(pars), MakeBeam(pars), pars.detector, step.Get(), r, depth.Get());

  HD5::Writer writer(oname.Get());
  writer.writeStruct(HD5::Keys::Params, pars);
  writer.writeTensor(HD5::Keys::Sinogram, HD5::Shape<2>{sino.data.dimension(0), sino.data.dimension(1)}, sino.data.data(),
                     HD5::Dims::Sinogram);
  writer.writeTensor(HD5::Keys::Angles, HD5::Shape<1>{sino.angles.dimension(0)}, sino.angles.data(), HD5::Dims::Angles);
  WriteLog(writer, cmd, oname.Get());
}
