#include "inputs.hpp"

#include "xr/algo/stats.hpp"
#include "xr/io/hd5.hpp"
#include "xr/log/log.hpp"
#include "xr/xray/geometry.hpp"

using namespace xr;

void main_roi(args::Subparser &parser)
{
  args::Positional<std::string> iname(parser, "FILE", "Input HD5 file");
  args::ValueFlag<std::string>  dset(parser, "D", "Dataset (radiograph)", {"dset", 'd'}, HD5::Keys::Radiograph);
  RectFlag                      roi(parser, "X,Y,W,H", "Region of interest in pixels", {"roi"});
  RectFlag                      bg(parser, "X,Y,W,H", "Background region in pixels", {"bg"});
  args::Flag                    masks(parser, "M", "Use the lesion and background masks in the file", {"masks"});
  args::Flag                    landmarks(parser, "L", "Place ROIs on the landmarks stored in the file", {"landmarks"});
  args::ValueFlag<float>        half(parser, "H", "Landmark ROI half-width in mm (half the lesion radius)", {"half"}, -1.f);
  ParseCommand(parser, iname);
  auto const cmd = parser.GetCommand().Name();

  HD5::Reader reader(iname.Get());
  auto const  img = reader.readTensor<Re2>(dset.Get());
  ROIStat     lesion, background;
  if (masks) {
    B2 const lm = reader.readTensor<Re2>(HD5::Keys::LesionMask) > 0.5f;
    B2 const bm = reader.readTensor<Re2>(HD5::Keys::BackgroundMask) > 0.5f;
    lesion = ROIStats(img, lm, bm);
    background = ROIStats(img, bm, bm);
  } else if (landmarks) {
    auto const meta = reader.readMeta();
    auto const pars = reader.readStruct<AcquisitionParams>(HD5::Keys::Params);
    auto const geom = MakeGeometry(pars);
    for (auto const key : {"lesion_x", "lesion_y", "lesion_radius", "background_x", "background_y"}) {
      if (!meta.contains(key)) { throw Log::Failure(cmd, "File {} has no landmark {}", iname.Get(), key); }
    }
    float const h = half.Get() > 0.f ? half.Get() : 0.5f * meta.at("lesion_radius");
    Rect const  lr = RectAround(geom, pars.detector, Point2(meta.at("lesion_x"), meta.at("lesion_y")), h);
    Rect const  br = RectAround(geom, pars.detector, Point2(meta.at("background_x"), meta.at("background_y")), h);
    lesion = ROIStats(img, lr, br);
    background = ROIStats(img, br, br);
  } else {
    if (!roi || !bg) { throw args::Error("Specify --roi and --bg, or --masks, or --landmarks"); }
    lesion = ROIStats(img, roi.Get(), bg.Get());
    background = ROIStats(img, bg.Get(), bg.Get());
  }
  Log::Print(cmd, "ROI {}±{} background {}±{} contrast {}", lesion.mean, lesion.std, background.mean, background.std,
             lesion.contrast);
  fmt::print("roi {:.6f} {:.6f}\nbackground {:.6f} {:.6f}\ncontrast {:.6f}\n", lesion.mean, lesion.std, background.mean,
             background.std, lesion.contrast);
}
