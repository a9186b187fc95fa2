#pragma once

#include "../types.hpp"

#include <algorithm>

namespace xr {

struct Detector
{
  Sz2            shape{256, 256};
  float          pitch = 0.8f;                    // mm at the detector
  Eigen::Array2f offset = Eigen::Array2f::Zero(); // mm, shift of the detector centre from the beam axis
};

struct AcquisitionParams
{
  float    sid = 500.f;       // Source to isocentre, mm
  float    sdd = 1000.f;      // Source to detector, mm
  float    angle = 0.f;       // degrees
  float    kVp = 30.f;        // Peak tube voltage
  float    exposure = 1.f;    // s, relative to the 1 s reference
  float    filtration = 2.f;  // mm Al
  bool     grid = false;
  Detector detector;
};

struct Range
{
  float lo, hi, initial;

  auto clamp(float const v) const -> float { return std::clamp(v, lo, hi); }
};

/*
 * Recommended slider ranges for interactive front ends. Front ends clamp to these before calling the core, the
 * core itself still rejects anything non-physical.
 */
struct Defaults
{
  Range angle{0.f, 180.f, 30.f};
  Range sid{200.f, 1200.f, 500.f};
  Range sdd{400.f, 1600.f, 1000.f};
  Range kVp{20.f, 120.f, 30.f};
  Range exposure{0.01f, 3.f, 1.f};
  Range filtration{0.f, 10.f, 2.f};
  float compression = 0.65f;
};

inline Defaults const SliderDefaults{};

auto Initial(Defaults const &d) -> AcquisitionParams;
auto Clamp(AcquisitionParams const &p, Defaults const &d) -> AcquisitionParams;

} // namespace xr
