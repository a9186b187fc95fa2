#include "params.hpp"

namespace xr {

auto Initial(Defaults const &d) -> AcquisitionParams
{
  AcquisitionParams p;
  p.angle = d.angle.initial;
  p.sid = d.sid.initial;
  p.sdd = d.sdd.initial;
  p.kVp = d.kVp.initial;
  p.exposure = d.exposure.initial;
  p.filtration = d.filtration.initial;
  return p;
}

auto Clamp(AcquisitionParams const &p, Defaults const &d) -> AcquisitionParams
{
  AcquisitionParams c = p;
  c.angle = d.angle.clamp(p.angle);
  c.sid = d.sid.clamp(p.sid);
  c.sdd = d.sdd.clamp(p.sdd);
  c.kVp = d.kVp.clamp(p.kVp);
  c.exposure = d.exposure.clamp(p.exposure);
  c.filtration = d.filtration.clamp(p.filtration);
  return c;
}

} // namespace xr
