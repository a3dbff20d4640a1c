#include "Cli.h"

#include <deskboot/Config.h>
#include <deskboot/Process.h>
#include <deskboot/Session.h>

#include <cstdlib>
#include <iostream>

#ifdef __linux__
#include <systemd/sd-daemon.h>
#endif

using namespace deskboot;

namespace {
constexpr int usage_error = 2;
} // namespace

int
main(int argc, char* argv[]) {
  auto options = parseOptions(argc, argv);
  if (!options.has_value()) {
    std::cerr << "deskboot: " << to_string(options.error()) << "\n";
    printUsage(std::cerr, argv[0]);
    return usage_error;
  }

  if (options->help) {
    printUsage(std::cout, argv[0]);
    return EXIT_SUCCESS;
  }

  auto config = loadConfigOrDefault(options->configPath);
  if (!config.has_value()) {
    std::cerr << "deskboot: " << to_string(config.error()) << std::endl;
    return EXIT_FAILURE;
  }

  if (options->dryRun) {
    printPlan(std::cout, *config);
    return EXIT_SUCCESS;
  }

  PosixLauncher launcher;
  Session session(std::move(*config), launcher);

  if (auto res = session.run(); !res) {
    std::cerr << "deskboot: " << to_string(res.error()) << std::endl;
    return EXIT_FAILURE;
  }

  // Tell systemd we're done when started as a notify service.
#ifdef __linux__
  sd_notify(0, "READY=1");
#endif

  std::cout << "deskboot: session started" << std::endl;
  return EXIT_SUCCESS;
}
