#include "inputs.hpp"
#include "outputs.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"
#include "xr/xray/simulate.hpp"

using namespace xr;

void main_simulate(args::Subparser &parser)
{
  args::Positional<std::string> oname(parser, "FILE", "Output file");
  AcquisitionArgs               acqArgs(parser);
  PhantomArgs                   phanArgs(parser);
  args::ValueFlag<float>        muScale(parser, "F", "Scale attenuation coefficients (1)", {"mu-scale"}, 1.f);
  args::ValueFlag<float>        roiHalf(parser, "H", "ROI half-width in mm (half the lesion radius)", {"roi-half"}, -1.f);
  ParseCommand(parser, oname);
  auto const cmd = parser.GetCommand().Name();

  SimulationRequest const req{
    .params = acqArgs.Get(), .phantom = phanArgs.Get(), .muScale = muScale.Get(), .roiHalf = roiHalf.Get()};
  auto const r = Simulate(req);

  HD5::Writer writer(oname.Get());
  WriteMap(writer, r.phantom.map);
  WriteMasks(writer, r.phantom);
  writer.writeStruct(HD5::Keys::Params, req.params);
  writer.writeTensor(HD5::Keys::Radiograph, HD5::Shape<2>{r.radiograph.dimension(0), r.radiograph.dimension(1)},
                     r.radiograph.data(), HD5::Dims::Radiograph);
  std::map<std::string, float> meta{{"I0", r.beam.I0()}, {"magnification", r.geometry.magnification}};
  AddLandmarks(meta, r.phantom.landmarks);
  AddStats(meta, "lesion", r.lesion);
  AddStats(meta, "background", r.background);
  writer.writeMeta(meta);
  WriteLog(writer, cmd, oname.Get());
  fmt::print("lesion {:.4f} ± {:.4f}\nbackground {:.4f} ± {:.4f}\ncontrast {:.4f}\n", r.lesion.mean, r.lesion.std,
             r.background.mean, r.background.std, r.lesion.contrast);
}
