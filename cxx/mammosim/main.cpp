#include "args.hpp"
#include "xr/log/log.hpp"

using namespace xr;

#define COMMAND(PARSER, NM, CMD, DESC)                                                                                         \
  void          main_##NM(args::Subparser &parser);                                                                            \
  args::Command NM(PARSER, CMD, DESC, &main_##NM);

int main(int const argc, char const *const argv[])
{
  args::ArgumentParser parser("MAMMOSIM");
  args::GlobalOptions  globals(parser, global_group);

  args::Group sim(parser, "SIMULATE");
  COMMAND(sim, phantom, "phantom", "Make a breast (or Shepp-Logan) attenuation map");
  COMMAND(sim, project, "project", "Project an attenuation map to a radiograph");
  COMMAND(sim, sinogram, "sinogram", "Sweep the beam angle and stack projections");
  COMMAND(sim, simulate, "simulate", "Phantom, radiograph and lesion contrast in one go");
  COMMAND(sim, scenarios, "scenarios", "Generate the teaching figure set");

  args::Group analysis(parser, "ANALYSIS");
  COMMAND(analysis, profile, "profile", "Extract a line profile");
  COMMAND(analysis, roi, "roi", "Region of interest mean, std and contrast");

  args::Group util(parser, "UTIL");
  COMMAND(util, defaults, "defaults", "Print recommended parameter ranges");
#ifdef BUILD_MONTAGE
  COMMAND(util, png, "png", "Render a dataset to PNG");
#endif
  COMMAND(util, version, "version", "Print version number");

  try {
    parser.ParseCLI(argc, argv);
    Log::End();
  } catch (args::Help &) {
    fmt::print(stderr, "{}\n", parser.Help());
    return EXIT_SUCCESS;
  } catch (args::Error &e) {
    fmt::print(stderr, "{}\n", parser.Help());
    fmt::print(stderr, fmt::fg(fmt::terminal_color::bright_red), "{}\n", e.what());
    return EXIT_FAILURE;
  } catch (Log::Failure &f) {
    Log::Fail(f);
    Log::End();
    return EXIT_FAILURE;
  } catch (std::exception const &e) {
    Log::Fail(Log::Failure("None", "{}", e.what()));
    Log::End();
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
