#include "inputs.hpp"

#include "xr/log/log.hpp"

using namespace xr;

void main_defaults(args::Subparser &parser)
{
  parser.Parse();
  auto const &d = SliderDefaults;
  auto const  row = [](std::string const &name, std::string const &unit, Range const &r) {
    fmt::print("{:<12} {:>8} {:>8} {:>8}  {}\n", name, r.lo, r.hi, r.initial, unit);
  };
  fmt::print("{:<12} {:>8} {:>8} {:>8}\n", "parameter", "min", "max", "initial");
  row("angle", "degrees", d.angle);
  row("sid", "mm", d.sid);
  row("sdd", "mm", d.sdd);
  row("kvp", "kVp", d.kVp);
  row("exposure", "s", d.exposure);
  row("filtration", "mm Al", d.filtration);
  fmt::print("{:<12} {:>8}\n", "compression", d.compression);
}
