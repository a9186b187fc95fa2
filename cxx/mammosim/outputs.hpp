#pragma once

#include "xr/algo/stats.hpp"
#include "xr/io/writer.hpp"
#include "xr/phantom/breast.hpp"

namespace xr {

void WriteMap(HD5::Writer &writer, AttenuationMap const &map);
void WriteMasks(HD5::Writer &writer, Phantom const &phantom);
void AddLandmarks(std::map<std::string, float> &meta, Landmarks const &l);
void WriteLog(HD5::Writer &writer, std::string const &cmd, std::string const &fname);

} // namespace xr
