#pragma once

#include "Error.h"
#include "Process.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace deskboot {

constexpr std::string_view default_config_path = "/etc/deskboot/config.toml";

struct EnvironmentConfig {
  // Created if missing.
  std::vector<std::filesystem::path> directories;

  // Generated once, used by the bus to identify the machine.
  std::filesystem::path machineId;

  // Exported as XDG_RUNTIME_DIR, forced to mode 0700.
  std::filesystem::path runtimeDir;
};

struct DriverConfig {
  std::filesystem::path searchDir;
  std::string pattern;
  std::filesystem::path alias;
};

struct BusConfig {
  std::vector<std::string> command;
  std::filesystem::path log;
  std::optional<ReadinessProbe> ready;
};

struct DisplayConfig {
  std::string command;
  std::string display;

  std::string modulePath;
  std::string xkbDir;
  int logVerbosity = 0;
  std::string logFile;
  std::string keyboard;
  std::string pointer;
  bool noVtSwitch = true;
  bool keepTty = true;
  std::vector<std::string> extraArgs;

  std::filesystem::path log;
  std::optional<ReadinessProbe> ready;

  /// Full argument vector, starting with the command.
  std::vector<std::string> arguments() const;
};

struct DesktopSessionConfig {
  std::vector<std::string> command;
  std::filesystem::path log;
  mode_t logPermissions = 0600;
  std::optional<ReadinessProbe> ready;
};

struct Config {
  EnvironmentConfig environment;
  DriverConfig driver;
  BusConfig bus;
  DisplayConfig display;
  DesktopSessionConfig session;

  static Config getDefault();
};

struct ConfigError {
  enum { Missing, Syntax } type;
  std::string msg;
};

inline std::string
to_string(const ConfigError& err) { // NOLINT
  return err.type == ConfigError::Missing ? "missing config file: " + err.msg
                                          : "config error: " + err.msg;
}

/// Parses a config document. Keys that are absent keep their default value.
ErrorOr<Config, ConfigError>
parseConfig(std::string_view text);

ErrorOr<Config, ConfigError>
loadConfig(const std::filesystem::path& path);

/// Loads `path` if given, otherwise the default location if it exists,
/// otherwise returns the built-in default.
ErrorOr<Config, ConfigError>
loadConfigOrDefault(const std::optional<std::filesystem::path>& path);

} // namespace deskboot
