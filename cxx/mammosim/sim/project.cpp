#include "inputs.hpp"
#include "outputs.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"
#include "xr/xray/projector.hpp"

using namespace xr;

void main_project(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input phantom file");
  args::Positional<std::string> oname(parser, "FILE", "Output radiograph file");
  AcquisitionArgs               acqArgs(parser);
  args::ValueFlag<float>        muScale(parser, "F", "Scale attenuation coefficients (1)", {"mu-scale"}, 1.f);
  args::ValueFlag<Index>        depth(parser, "N", "Depth samples per ray (32)", {"depth"}, ProjectorOpts().depthSamples);
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  HD5::Reader reader(iname.Get());
  auto        map = ReadMap(reader);
  if (muScale) { map = Scaled(map, muScale.Get()); }

  auto const pars = acqArgs.Get();
  auto const geom = MakeGeometry(pars);
  auto const beam = MakeBeam(pars);
  Re2 const  I = Project(map, geom, beam, pars.detector, ProjectorOpts{.depthSamples = depth.Get()});

  HD5::Writer writer(oname.Get());
  writer.writeStruct(HD5::Keys::Params, pars);
  writer.writeTensor(HD5::Keys::Radiograph, HD5::Shape<2>{I.dimension(0), I.dimension(1)}, I.data(), HD5::Dims::Radiograph);
  writer.writeMeta({{"I0", beam.I0()}, {"magnification", geom.magnification}});
  WriteLog(writer, cmd, oname.Get());
}
