#include "beam.hpp"

#include "../errors.hpp"
#include "params.hpp"

#include <cmath>

namespace xr {

auto EnergyScale(float const kVp) -> float { return ReferenceKVp / kVp; }

auto Filtration(float const mm, float const kVp) -> float { return mm * AluminiumMu * EnergyScale(kVp); }

auto Beam::I0() const -> float
{
  float const r = kVp / ReferenceKVp;
  return exposure * r * r;
}

auto Beam::gain() const -> float { return grid ? GridFactor : 1.f; }

auto Beam::attenuation(float const L) const -> float { return L * EnergyScale(kVp) + Filtration(filtration, kVp); }

auto Beam::transmit(float const L) const -> float { return I0() * gain() * std::exp(-attenuation(L)); }

auto MakeBeam(float const kVp, float const exposure, float const filtration, bool const grid) -> Beam
{
  if (!(kVp > 0.f) || !std::isfinite(kVp)) { throw ParameterError("kVp must be positive, was {}", kVp); }
  if (!(exposure > 0.f) || !std::isfinite(exposure)) { throw ParameterError("Exposure must be positive, was {}", exposure); }
  if (!(filtration >= 0.f) || !std::isfinite(filtration)) {
    throw ParameterError("Filtration must be non-negative, was {} mm", filtration);
  }
  return Beam{.kVp = kVp, .exposure = exposure, .filtration = filtration, .grid = grid};
}

auto MakeBeam(AcquisitionParams const &p) -> Beam { return MakeBeam(p.kVp, p.exposure, p.filtration, p.grid); }

} // namespace xr
