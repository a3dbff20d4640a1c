#include "deskboot/Supervisor.h"

#include "deskboot/ShellSyntax.h"

#include <charconv>
#include <iostream>
#include <thread>

namespace deskboot {

namespace {

std::string
describe(const ProcessSpec& spec) {
  std::string result;
  for (const auto& arg : spec.argv) {
    if (!result.empty()) {
      result += ' ';
    }
    result += shellQuote(arg);
  }
  return result;
}

std::optional<pid_t>
parsePid(const std::optional<std::string>& str) {
  if (!str.has_value()) {
    return std::nullopt;
  }

  pid_t pid = 0;
  const auto* end = str->data() + str->size();
  auto [ptr, ec] = std::from_chars(str->data(), end, pid);
  if (ec != std::errc() || ptr != end || pid <= 0) {
    return std::nullopt;
  }
  return pid;
}

} // namespace

ProcessSpec
busSpec(const BusConfig& config) {
  ProcessSpec spec;
  spec.name = "message bus";
  spec.argv = config.command;
  spec.log = config.log;
  spec.ready = config.ready;
  return spec;
}

ProcessSpec
displayServerSpec(const DisplayConfig& config) {
  ProcessSpec spec;
  spec.name = "display server";
  spec.argv = config.arguments();
  spec.log = config.log;
  spec.ready = config.ready;
  return spec;
}

ProcessSpec
desktopSessionSpec(const DesktopSessionConfig& config) {
  ProcessSpec spec;
  spec.name = "desktop session";
  spec.argv = config.command;
  spec.log = config.log;
  spec.logMode = LogMode::TruncateRestricted;
  spec.logPermissions = config.logPermissions;
  spec.ready = config.ready;
  return spec;
}

OptError<>
waitUntilReady(const ReadinessProbe& probe,
               std::chrono::milliseconds interval) {
  const auto deadline = std::chrono::steady_clock::now() + probe.timeout;

  while (true) {
    std::error_code ec;
    if (std::filesystem::exists(probe.path, ec)) {
      return {};
    }

    if (std::chrono::steady_clock::now() >= deadline) {
      return Error::make("Timed out after " +
                         std::to_string(probe.timeout.count()) +
                         "ms waiting for " + probe.path.string());
    }

    std::this_thread::sleep_for(interval);
  }
}

ErrorOr<std::optional<LaunchRecord>>
Supervisor::launchBus(const ProcessSpec& spec) {
  if (!mLauncher.isAvailable(spec, mEnv)) {
    std::cout << "deskboot: "
              << (spec.argv.empty() ? spec.name : spec.argv.front())
              << " not installed, not starting the " << spec.name << std::endl;
    return std::nullopt;
  }

  std::cout << "deskboot: starting " << spec.name << ": " << describe(spec)
            << std::endl;
  auto captured = DESKBOOT_TRY(mLauncher.capture(spec, mEnv));

  auto vars = DESKBOOT_TRY(
    parseShellAssignments(captured.output).map_error([&spec](Error err) {
      return Error{ spec.name + " output, " + err.msg };
    }));
  mEnv.merge(vars);

  // The launcher exits after forking the daemon, report the daemon if known.
  auto pid = parsePid(vars.get("DBUS_SESSION_BUS_PID")).value_or(captured.pid);
  auto rec = record(spec, pid);

  if (spec.ready.has_value()) {
    DESKBOOT_TRY(waitUntilReady(*spec.ready));
  }
  return rec;
}

ErrorOr<LaunchRecord>
Supervisor::launchDisplayServer(const ProcessSpec& spec) {
  // DISPLAY only becomes valid once the server is up.
  auto env = mEnv;
  env.unset("DISPLAY");
  return launch(spec, env);
}

ErrorOr<LaunchRecord>
Supervisor::launchSession(const ProcessSpec& spec, std::string_view display) {
  mEnv.set("DISPLAY", std::string(display));
  return launch(spec, mEnv);
}

ErrorOr<LaunchRecord>
Supervisor::launch(const ProcessSpec& spec, const Environment& env) {
  std::cout << "deskboot: starting " << spec.name << ": " << describe(spec)
            << std::endl;

  const auto pid = DESKBOOT_TRY(mLauncher.spawn(spec, env));
  auto rec = record(spec, pid);

  if (spec.ready.has_value()) {
    DESKBOOT_TRY(waitUntilReady(*spec.ready));
  }
  return rec;
}

LaunchRecord&
Supervisor::record(const ProcessSpec& spec, pid_t pid) {
  std::cout << "deskboot: " << spec.name << " started, pid " << pid;
  if (!spec.log.empty()) {
    std::cout << ", log " << spec.log.string();
  }
  std::cout << std::endl;

  return mLaunches.emplace_back(
    LaunchRecord{ spec.name, pid, std::chrono::steady_clock::now() });
}

} // namespace deskboot
