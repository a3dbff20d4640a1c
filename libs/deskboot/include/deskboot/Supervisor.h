#pragma once

#include "Config.h"
#include "Environment.h"
#include "Error.h"
#include "Process.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskboot {

struct LaunchRecord {
  std::string name;
  pid_t pid = -1;
  std::chrono::steady_clock::time_point startedAt;
};

ProcessSpec
busSpec(const BusConfig& config);

ProcessSpec
displayServerSpec(const DisplayConfig& config);

ProcessSpec
desktopSessionSpec(const DesktopSessionConfig& config);

/// Polls until the probe path exists.
OptError<>
waitUntilReady(const ReadinessProbe& probe,
               std::chrono::milliseconds interval = std::chrono::milliseconds(
                 50));

/// Launches the managed processes in order. Launches are fire-and-forget:
/// only an optional readiness probe is waited for, never the process itself.
class Supervisor {
public:
  Supervisor(ProcessLauncher& launcher, Environment& env)
    : mLauncher(launcher), mEnv(env) {}

  /// Runs the bus launcher and merges the variables it prints into the
  /// environment.
  /// \returns nullopt if the bus launcher isn't installed.
  ErrorOr<std::optional<LaunchRecord>> launchBus(const ProcessSpec& spec);

  /// Starts the display server without DISPLAY in its environment.
  ErrorOr<LaunchRecord> launchDisplayServer(const ProcessSpec& spec);

  /// Exports DISPLAY and starts the desktop session.
  ErrorOr<LaunchRecord> launchSession(const ProcessSpec& spec,
                                      std::string_view display);

  const std::vector<LaunchRecord>& launches() const { return mLaunches; }

private:
  ErrorOr<LaunchRecord> launch(const ProcessSpec& spec,
                               const Environment& env);
  LaunchRecord& record(const ProcessSpec& spec, pid_t pid);

  ProcessLauncher& mLauncher;
  Environment& mEnv;
  std::vector<LaunchRecord> mLaunches;
};

} // namespace deskboot
