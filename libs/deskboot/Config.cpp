#include "deskboot/Config.h"

#include <filesystem>
#include <toml++/toml.h>

namespace deskboot {

namespace {
constexpr std::string_view default_config = R"(
[environment]
# Created if missing.
directories = ["/var/lib/dbus", "/usr/share/X11/xorg.conf.d"]

# Generated once if it doesn't exist.
machine-id = "/var/lib/dbus/machine-id"

# Exported as XDG_RUNTIME_DIR, only accessible by its owner.
runtime-dir = "/run/user/0"

[driver]
# The first entry of search-dir matching pattern is linked to alias.
search-dir = "/nix/store"
pattern = "*-graphics-drivers"
alias = "/run/opengl-driver"

[bus]
# Skipped if the command isn't installed.
command = ["dbus-launch", "--sh-syntax"]
log = "/var/log/dbus-launch.log"

[display]
command = "Xorg"
display = ":0"
module-path = "/run/current-system/sw/lib/xorg/modules"
xkb-dir = "/run/current-system/sw/share/X11/xkb"
log-verbosity = 0
log-file = "/var/log/xorg_debug.log"
keyboard = "keyboard"
pointer = "mouse0"
no-vt-switch = true
keep-tty = true
extra-args = []
log = "/var/log/xorg.log"

# Optionally wait for the server socket before starting the session:
# ready-path = "/tmp/.X11-unix/X0"
# ready-timeout-ms = 5000

[session]
command = ["xfce4-session"]
# Truncated on every start.
log = "/var/log/xfce-session.log"
log-mode = 0o600
)";

tl::unexpected<ConfigError>
syntaxError(std::string msg) {
  return tl::unexpected(ConfigError{ ConfigError::Syntax, std::move(msg) });
}

/// A section of the document, remembering its name for error messages.
struct Section {
  std::string_view name;
  const toml::table& table;

  std::string key(std::string_view key) const {
    return std::string(name) + "." + std::string(key);
  }
};

template<typename T>
ErrorOr<T, ConfigError>
getValue(const Section& section, std::string_view key, T current) {
  auto node = section.table[key];
  if (!node) {
    return current;
  }

  auto value = node.value<T>();
  if (!value.has_value()) {
    return syntaxError("Invalid value for " + section.key(key));
  }
  return *value;
}

ErrorOr<std::filesystem::path, ConfigError>
getPath(const Section& section,
        std::string_view key,
        const std::filesystem::path& current) {
  return getValue<std::string>(section, key, current.string())
    .map([](std::string str) { return std::filesystem::path(std::move(str)); });
}

ErrorOr<std::vector<std::string>, ConfigError>
getStrings(const Section& section,
           std::string_view key,
           std::vector<std::string> current) {
  auto node = section.table[key];
  if (!node) {
    return current;
  }

  const auto* array = node.as_array();
  if (array == nullptr) {
    return syntaxError("Expected an array of strings for " + section.key(key));
  }

  std::vector<std::string> result;
  for (const auto& elem : *array) {
    auto str = elem.value<std::string>();
    if (!str.has_value()) {
      return syntaxError("Expected an array of strings for " +
                         section.key(key));
    }
    result.push_back(std::move(*str));
  }
  return result;
}

/// A command is either a single string or an argument array.
ErrorOr<std::vector<std::string>, ConfigError>
getCommand(const Section& section, std::vector<std::string> current) {
  auto node = section.table["command"];
  if (auto str = node.value<std::string>(); str.has_value()) {
    return std::vector<std::string>{ std::move(*str) };
  }

  auto command =
    DESKBOOT_TRY(getStrings(section, "command", std::move(current)));
  if (command.empty()) {
    return syntaxError("Empty command for " + section.key("command"));
  }
  return command;
}

ErrorOr<std::optional<ReadinessProbe>, ConfigError>
getProbe(const Section& section, std::optional<ReadinessProbe> current) {
  const auto path = DESKBOOT_TRY(getValue<std::string>(
    section, "ready-path", current ? current->path.string() : ""));
  if (path.empty()) {
    return std::nullopt;
  }

  ReadinessProbe probe;
  probe.path = path;

  const auto timeout = DESKBOOT_TRY(getValue<int64_t>(
    section,
    "ready-timeout-ms",
    current ? current->timeout.count() : probe.timeout.count()));
  if (timeout <= 0) {
    return syntaxError("Timeout must be positive for " +
                       section.key("ready-timeout-ms"));
  }
  probe.timeout = std::chrono::milliseconds(timeout);

  return probe;
}

ErrorOr<Section, ConfigError>
getSection(const toml::table& tbl, std::string_view name) {
  static const toml::table empty;

  auto node = tbl[name];
  if (!node) {
    return Section{ name, empty };
  }

  const auto* table = node.as_table();
  if (table == nullptr) {
    return syntaxError("Expected a table for " + std::string(name));
  }
  return Section{ name, *table };
}

ErrorOr<Config, ConfigError>
getConfig(const toml::table& tbl, Config cfg) {
  {
    const auto section = DESKBOOT_TRY(getSection(tbl, "environment"));
    auto& env = cfg.environment;

    std::vector<std::string> dirs;
    for (const auto& dir : env.directories) {
      dirs.push_back(dir.string());
    }
    dirs = DESKBOOT_TRY(getStrings(section, "directories", dirs));
    env.directories.assign(dirs.begin(), dirs.end());

    env.machineId = DESKBOOT_TRY(getPath(section, "machine-id", env.machineId));
    env.runtimeDir =
      DESKBOOT_TRY(getPath(section, "runtime-dir", env.runtimeDir));
  }

  {
    const auto section = DESKBOOT_TRY(getSection(tbl, "driver"));
    auto& driver = cfg.driver;

    driver.searchDir =
      DESKBOOT_TRY(getPath(section, "search-dir", driver.searchDir));
    driver.pattern =
      DESKBOOT_TRY(getValue<std::string>(section, "pattern", driver.pattern));
    driver.alias = DESKBOOT_TRY(getPath(section, "alias", driver.alias));

    if (driver.pattern.empty()) {
      return syntaxError("Empty pattern for " + section.key("pattern"));
    }
  }

  {
    const auto section = DESKBOOT_TRY(getSection(tbl, "bus"));
    auto& bus = cfg.bus;

    bus.command = DESKBOOT_TRY(getCommand(section, bus.command));
    bus.log = DESKBOOT_TRY(getPath(section, "log", bus.log));
    bus.ready = DESKBOOT_TRY(getProbe(section, bus.ready));
  }

  {
    const auto section = DESKBOOT_TRY(getSection(tbl, "display"));
    auto& display = cfg.display;

    display.command =
      DESKBOOT_TRY(getValue<std::string>(section, "command", display.command));
    display.display =
      DESKBOOT_TRY(getValue<std::string>(section, "display", display.display));
    display.modulePath = DESKBOOT_TRY(
      getValue<std::string>(section, "module-path", display.modulePath));
    display.xkbDir =
      DESKBOOT_TRY(getValue<std::string>(section, "xkb-dir", display.xkbDir));
    display.logVerbosity = static_cast<int>(DESKBOOT_TRY(
      getValue<int64_t>(section, "log-verbosity", display.logVerbosity)));
    display.logFile =
      DESKBOOT_TRY(getValue<std::string>(section, "log-file", display.logFile));
    display.keyboard = DESKBOOT_TRY(
      getValue<std::string>(section, "keyboard", display.keyboard));
    display.pointer =
      DESKBOOT_TRY(getValue<std::string>(section, "pointer", display.pointer));
    display.noVtSwitch =
      DESKBOOT_TRY(getValue<bool>(section, "no-vt-switch", display.noVtSwitch));
    display.keepTty =
      DESKBOOT_TRY(getValue<bool>(section, "keep-tty", display.keepTty));
    display.extraArgs =
      DESKBOOT_TRY(getStrings(section, "extra-args", display.extraArgs));
    display.log = DESKBOOT_TRY(getPath(section, "log", display.log));
    display.ready = DESKBOOT_TRY(getProbe(section, display.ready));

    if (display.command.empty() || display.display.empty()) {
      return syntaxError("display.command and display.display are required");
    }
  }

  {
    const auto section = DESKBOOT_TRY(getSection(tbl, "session"));
    auto& session = cfg.session;

    session.command = DESKBOOT_TRY(getCommand(section, session.command));
    session.log = DESKBOOT_TRY(getPath(section, "log", session.log));
    const auto mode = DESKBOOT_TRY(
      getValue<int64_t>(section, "log-mode", session.logPermissions));
    if (mode < 0 || mode > 0777) {
      return syntaxError("Invalid permissions for " + section.key("log-mode"));
    }
    session.logPermissions = static_cast<mode_t>(mode);
    session.ready = DESKBOOT_TRY(getProbe(section, session.ready));
  }

  return cfg;
}

ErrorOr<toml::table, ConfigError>
parseTable(std::string_view text) {
  try {
    return toml::parse(text);
  } catch (const toml::parse_error& err) {
    return syntaxError(std::to_string(err.source().begin.line) + ": " +
                       std::string(err.description()));
  }
}

} // namespace

std::vector<std::string>
DisplayConfig::arguments() const {
  std::vector<std::string> args = { command, display };

  const auto addOption = [&args](const char* flag, const std::string& value) {
    if (!value.empty()) {
      args.emplace_back(flag);
      args.push_back(value);
    }
  };

  addOption("-modulepath", modulePath);
  addOption("-xkbdir", xkbDir);
  addOption("-logverbose", std::to_string(logVerbosity));
  addOption("-logfile", logFile);
  if (noVtSwitch) {
    args.emplace_back("-novtswitch");
  }
  if (keepTty) {
    args.emplace_back("-keeptty");
  }
  addOption("-keyboard", keyboard);
  addOption("-pointer", pointer);

  args.insert(args.end(), extraArgs.begin(), extraArgs.end());
  return args;
}

Config
Config::getDefault() {
  auto tbl = toml::parse(default_config);
  return *getConfig(tbl, Config{});
}

ErrorOr<Config, ConfigError>
parseConfig(std::string_view text) {
  const auto tbl = DESKBOOT_TRY(parseTable(text));
  return getConfig(tbl, Config::getDefault());
}

ErrorOr<Config, ConfigError>
loadConfig(const std::filesystem::path& path) {
  if (!std::filesystem::exists(path)) {
    return tl::unexpected(ConfigError{ ConfigError::Missing, path.string() });
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(path.string());
  } catch (const toml::parse_error& err) {
    return syntaxError(path.string() + ":" +
                       std::to_string(err.source().begin.line) + ": " +
                       std::string(err.description()));
  }

  return getConfig(tbl, Config::getDefault());
}

ErrorOr<Config, ConfigError>
loadConfigOrDefault(const std::optional<std::filesystem::path>& path) {
  if (path.has_value()) {
    return loadConfig(*path);
  }

  if (std::filesystem::exists(default_config_path)) {
    return loadConfig(default_config_path);
  }

  return Config::getDefault();
}

} // namespace deskboot
