#include "inputs.hpp"
#include "outputs.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"
#include "xr/phantom/shepp-logan.hpp"

using namespace xr;

void main_phantom(args::Subparser &parser)
{
  args::Positional<std::string> oname(parser, "FILE", "Filename to write phantom to");
  PhantomArgs                   phanArgs(parser);
  args::Flag                    shepp(parser, "S", "2D Shepp-Logan head phantom instead", {"shepp-logan"});
  ParseCommand(parser, oname);
  auto const cmd = parser.GetCommand().Name();

  auto const  opts = phanArgs.Get();
  HD5::Writer writer(oname.Get());
  if (shepp) {
    auto const map = SheppLogan2D(opts.matrix, opts.spacing, opts.thickness);
    WriteMap(writer, map);
  } else {
    auto const phantom = BreastPhantom(opts);
    WriteMap(writer, phantom.map);
    WriteMasks(writer, phantom);
    std::map<std::string, float> meta;
    AddLandmarks(meta, phantom.landmarks);
    writer.writeMeta(meta);
  }
  WriteLog(writer, cmd, oname.Get());
}
