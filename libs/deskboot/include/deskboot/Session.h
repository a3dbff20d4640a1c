#pragma once

#include "Config.h"
#include "Environment.h"
#include "Error.h"
#include "Process.h"
#include "Supervisor.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace deskboot {

/// Start -> PrepareEnv -> LinkDriver -> LaunchBus -> LaunchDisplayServer ->
/// LaunchSession -> Done. Any failing step moves to Fatal.
enum class Stage {
  Start,
  PrepareEnv,
  LinkDriver,
  LaunchBus,
  LaunchDisplayServer,
  LaunchSession,
  Done,
  Fatal,
};

std::string_view
to_string(Stage stage); // NOLINT

struct SessionError {
  // The step that failed.
  Stage stage;
  std::string msg;
};

inline std::string
to_string(const SessionError& err) { // NOLINT
  return std::string(to_string(err.stage)) + ": " + err.msg;
}

/// Brings up the desktop: prepares the filesystem, links the graphics
/// drivers and launches bus, display server and desktop session in order.
class Session {
public:
  Session(Config config,
          ProcessLauncher& launcher,
          Environment env = Environment::fromProcess());

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Runs all steps. Can only be run once.
  ErrorOr<void, SessionError> run();

  Stage stage() const { return mStage; }

  const std::vector<LaunchRecord>& launches() const {
    return mSupervisor.launches();
  }

  /// The environment after the steps that have run so far.
  const Environment& environment() const { return mEnv; }

  const std::optional<std::filesystem::path>& driver() const {
    return mDriver;
  }

private:
  ErrorOr<void, SessionError> runSteps();

  template<typename Fn>
  ErrorOr<void, SessionError> step(Stage stage, Fn&& fn);

  Config mConfig;
  Environment mEnv;
  Supervisor mSupervisor;
  Stage mStage = Stage::Start;

  std::optional<std::filesystem::path> mDriver;
};

} // namespace deskboot
