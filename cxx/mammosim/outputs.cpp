#include "outputs.hpp"

#include "xr/log/log.hpp"

namespace xr {

void WriteMap(HD5::Writer &writer, AttenuationMap const &map)
{
  writer.writeStruct(HD5::Keys::Info, map.info);
  writer.writeTensor(HD5::Keys::Mu, HD5::Shape<2>{map.mu.dimension(0), map.mu.dimension(1)}, map.mu.data(), HD5::Dims::Map);
  writer.writeTensor(HD5::Keys::Thickness, HD5::Shape<2>{map.thickness.dimension(0), map.thickness.dimension(1)},
                     map.thickness.data(), HD5::Dims::Map);
}

void WriteMasks(HD5::Writer &writer, Phantom const &phantom)
{
  Re2 const lesion = phantom.lesionMask.cast<float>();
  Re2 const bg = phantom.backgroundMask.cast<float>();
  writer.writeTensor(HD5::Keys::LesionMask, HD5::Shape<2>{lesion.dimension(0), lesion.dimension(1)}, lesion.data(),
                     HD5::Dims::Map);
  writer.writeTensor(HD5::Keys::BackgroundMask, HD5::Shape<2>{bg.dimension(0), bg.dimension(1)}, bg.data(), HD5::Dims::Map);
}

void AddLandmarks(std::map<std::string, float> &meta, Landmarks const &l)
{
  meta["lesion_x"] = l.lesion[0];
  meta["lesion_y"] = l.lesion[1];
  meta["lesion_radius"] = l.lesionRadius;
  meta["background_x"] = l.background[0];
  meta["background_y"] = l.background[1];
}

void WriteLog(HD5::Writer &writer, std::string const &cmd, std::string const &fname)
{
  if (Log::Saved().size()) { writer.writeStrings(HD5::Keys::Log, Log::Saved()); }
  Log::Print(cmd, "Wrote output file {}", fname);
}

} // namespace xr
