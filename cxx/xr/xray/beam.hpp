#pragma once

namespace xr {

struct AcquisitionParams;

/*
 * Simplified tube output. Energy dependence is a 1/kVp scaling of attenuation relative to a 30 kVp reference, and
 * the filter is modelled as an extra aluminium path.
 */
struct Beam
{
  float kVp, exposure, filtration;
  bool  grid;

  auto I0() const -> float;    // Incident intensity, exposure * (kVp / 30)^2
  auto gain() const -> float;  // 0.9 with the anti-scatter grid, otherwise 1
  auto attenuation(float const lineIntegral) const -> float; // Effective attenuation including the filter
  auto transmit(float const lineIntegral) const -> float;    // I0 * gain * exp(-attenuation)
};

float constexpr ReferenceKVp = 30.f;
float constexpr AluminiumMu = 0.15f; // per mm at the reference energy
float constexpr GridFactor = 0.9f;

auto EnergyScale(float const kVp) -> float;
auto Filtration(float const mm, float const kVp) -> float;

auto MakeBeam(float const kVp, float const exposure, float const filtration, bool const grid) -> Beam;
auto MakeBeam(AcquisitionParams const &p) -> Beam;

} // namespace xr
