#include "inputs.hpp"
#include "magick.hpp"

#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"

using namespace xr;

void main_png(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file");
  args::Positional<std::string> oname(parser, "FILE", "Output PNG file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset (radiograph)", {"dset", 'd'}, HD5::Keys::Radiograph);
  ArrayFlag<float, 2>           win(parser, "LO,HI", "Display window (default 1st-99th percentile)", {"win", 'w'});
  SzFlag<2>                     plotSize(parser, "W,H", "Profile plot size (800,400)", {"plot-size"}, Sz2{800, 400});
  ParseCommand(parser, iname, oname);

  Magick::InitializeMagick(NULL);
  HD5::Reader reader(iname.Get());
  auto const  order = reader.order(dset.Get());
  if (order == 1) {
    auto const    p = reader.readTensor<Re1>(dset.Get());
    Magick::Image plot = PlotProfiles({p}, plotSize.Get()[0], plotSize.Get()[1]);
    WritePNG(plot, oname.Get());
  } else if (order == 2) {
    auto const    img = reader.readTensor<Re2>(dset.Get());
    auto const    w = win ? std::array<float, 2>{win.Get()[0], win.Get()[1]} : Window(img);
    Magick::Image m = ToMagick(img, w[0], w[1]);
    WritePNG(m, oname.Get());
  } else {
    throw Log::Failure("png", "Dataset {} has order {}, can only render 1D profiles or 2D images", dset.Get(), order);
  }
}
