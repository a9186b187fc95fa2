#include "args.hpp"

#include "xr/log/log.hpp"

void main_version(args::Subparser &parser)
{
  parser.Parse();
  fmt::print("Version: {}\nCompile date: {}\n", MAMMOSIM_VERSION, __DATE__);
}
