#pragma once

#include "args.hpp"

#include "xr/io/reader.hpp"
#include "xr/phantom/breast.hpp"
#include "xr/xray/params.hpp"

struct AcquisitionArgs
{
  args::ValueFlag<float> sid, sdd, angle, kVp, exposure, filtration;
  args::Flag             grid;
  SzFlag<2>              shape;
  args::ValueFlag<float> pitch;
  ArrayFlag<float, 2>    offset;
  args::Flag             clamp;

  AcquisitionArgs(args::Subparser &parser);
  auto Get() -> xr::AcquisitionParams;
};

struct PhantomArgs
{
  SzFlag<2>              matrix;
  args::ValueFlag<float> spacing, thickness;
  args::Flag             compression;
  args::ValueFlag<float> scale;
  args::Flag             noLesion, noCalcs;
  ArrayFlag<float, 2>    lesion;
  args::ValueFlag<float> radius;

  PhantomArgs(args::Subparser &parser);
  auto Get() -> xr::PhantomOptions;
};

auto ReadMap(xr::HD5::Reader const &reader) -> xr::AttenuationMap;
