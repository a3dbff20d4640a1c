#include "Cli.h"

#include <deskboot/ShellSyntax.h>
#include <deskboot/Supervisor.h>

#include <iomanip>
#include <string_view>

using namespace deskboot;

namespace {

void
printCommand(std::ostream& os, const ProcessSpec& spec) {
  os << "  " << spec.name << ":";
  for (const auto& arg : spec.argv) {
    os << ' ' << shellQuote(arg);
  }
  os << '\n';

  if (!spec.log.empty()) {
    os << "    log " << spec.log.string();
    if (spec.logMode == LogMode::TruncateRestricted) {
      os << " (truncated, mode " << std::oct << std::setw(4)
         << std::setfill('0') << spec.logPermissions << std::dec
         << std::setfill(' ') << ")";
    }
    os << '\n';
  }

  if (spec.ready.has_value()) {
    os << "    wait for " << spec.ready->path.string() << " up to "
       << spec.ready->timeout.count() << "ms\n";
  }
}

} // namespace

ErrorOr<Options>
parseOptions(int argc, const char* const argv[]) {
  Options options;

  for (int i = 1; i < argc; i++) {
    const std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      options.help = true;
    } else if (arg == "-n" || arg == "--dry-run") {
      options.dryRun = true;
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        return Error::make(std::string(arg) + " requires a path");
      }
      options.configPath = argv[++i];
    } else if (arg.substr(0, 9) == "--config=") {
      options.configPath = std::string(arg.substr(9));
    } else {
      return Error::make("Unknown argument: " + std::string(arg));
    }
  }

  return options;
}

void
printUsage(std::ostream& os, const char* programName) {
  os << "Usage: " << programName << " [options]\n"
     << "\n"
     << "Prepares the runtime environment, links the graphics drivers and\n"
     << "starts the message bus, display server and desktop session.\n"
     << "\n"
     << "Options:\n"
     << "  -c, --config <path>  Config file, default "
     << default_config_path << "\n"
     << "  -n, --dry-run        Print the steps without running them\n"
     << "  -h, --help           Show this help\n";
}

void
printPlan(std::ostream& os, const Config& config) {
  const auto& env = config.environment;
  os << "prepare environment:\n";
  for (const auto& dir : env.directories) {
    os << "  mkdir -p " << dir.string() << '\n';
  }
  if (!env.machineId.empty()) {
    os << "  machine id " << env.machineId.string() << '\n';
  }
  if (!env.runtimeDir.empty()) {
    os << "  runtime dir " << env.runtimeDir.string() << " (mode 0700)\n";
  }

  const auto& driver = config.driver;
  os << "link driver:\n"
     << "  " << driver.alias.string() << " -> first of "
     << (driver.searchDir / driver.pattern).string() << '\n';

  os << "launch:\n";
  printCommand(os, busSpec(config.bus));
  printCommand(os, displayServerSpec(config.display));
  printCommand(os, desktopSessionSpec(config.session));
  os << "    DISPLAY=" << config.display.display << '\n';
}
