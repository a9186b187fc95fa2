#include "inputs.hpp"
#include "outputs.hpp"

#include "xr/algo/stats.hpp"
#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"

using namespace xr;

void main_profile(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file");
  args::Positional<std::string> oname(parser, "FILE", "Output HD5 file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset (radiograph)", {"dset", 'd'}, HD5::Keys::Radiograph);
  args::ValueFlag<Index>        axis(parser, "A", "Axis the profile runs along (0)", {"axis"}, 0);
  args::ValueFlag<Index>        index(parser, "I", "Index on the other axis (default centre)", {"index", 'i'}, -1);
  args::Flag                    print(parser, "P", "Print the profile to stdout", {"print"});
  ParseCommand(parser, iname, oname);
  auto const cmd = parser.GetCommand().Name();

  HD5::Reader reader(iname.Get());
  auto const  img = reader.readTensor<Re2>(dset.Get());
  Index const other = axis.Get() == 0 ? 1 : 0;
  Index const ind = index.Get() < 0 && axis.Get() >= 0 && axis.Get() < 2 ? img.dimension(other) / 2 : index.Get();
  Re1 const   p = ExtractProfile(img, axis.Get(), ind);
  Log::Print(cmd, "Profile along axis {} at index {}, {} points", axis.Get(), ind, p.size());

  HD5::Writer writer(oname.Get());
  writer.writeTensor(HD5::Keys::Profile, HD5::Shape<1>{p.dimension(0)}, p.data(), HD5::Dims::Profile);
  writer.writeMeta({{"axis", float(axis.Get())}, {"index", float(ind)}});
  WriteLog(writer, cmd, oname.Get());
  if (print) { fmt::print("{}\n", fmt::join(p.data(), p.data() + p.size(), "\n")); }
}
