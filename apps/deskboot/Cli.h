#pragma once

#include <deskboot/Config.h>
#include <deskboot/Error.h>

#include <filesystem>
#include <optional>
#include <ostream>

struct Options {
  std::optional<std::filesystem::path> configPath;
  bool dryRun = false;
  bool help = false;
};

deskboot::ErrorOr<Options>
parseOptions(int argc, const char* const argv[]);

void
printUsage(std::ostream& os, const char* programName);

/// Prints what a run with `config` would do, without doing any of it.
void
printPlan(std::ostream& os, const deskboot::Config& config);
