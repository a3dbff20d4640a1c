#include "deskboot/Session.h"

#include "deskboot/DriverLinker.h"
#include "deskboot/Preparer.h"

#include <iostream>

namespace deskboot {

std::string_view
to_string(Stage stage) { // NOLINT
  switch (stage) {
    case Stage::Start:
      return "start";
    case Stage::PrepareEnv:
      return "prepare environment";
    case Stage::LinkDriver:
      return "link driver";
    case Stage::LaunchBus:
      return "launch bus";
    case Stage::LaunchDisplayServer:
      return "launch display server";
    case Stage::LaunchSession:
      return "launch session";
    case Stage::Done:
      return "done";
    case Stage::Fatal:
      return "fatal";
  }
  return "unknown";
}

Session::Session(Config config, ProcessLauncher& launcher, Environment env)
  : mConfig(std::move(config))
  , mEnv(std::move(env))
  , mSupervisor(launcher, mEnv) {}

template<typename Fn>
ErrorOr<void, SessionError>
Session::step(Stage stage, Fn&& fn) {
  mStage = stage;

  auto res = fn();
  if (!res.has_value()) {
    mStage = Stage::Fatal;
    return tl::unexpected(SessionError{ stage, to_string(res.error()) });
  }
  return {};
}

ErrorOr<void, SessionError>
Session::run() {
  if (mStage != Stage::Start) {
    return tl::unexpected(
      SessionError{ mStage, "session has already been started" });
  }

  DESKBOOT_TRY(runSteps());

  mStage = Stage::Done;
  return {};
}

ErrorOr<void, SessionError>
Session::runSteps() {
  DESKBOOT_TRY(step(Stage::PrepareEnv, [this] {
    return prepareEnvironment(mConfig.environment, mEnv);
  }));

  DESKBOOT_TRY(step(Stage::LinkDriver, [this] {
    return linkDriver(mConfig.driver).map([this](std::filesystem::path path) {
      mDriver = std::move(path);
    });
  }));

  DESKBOOT_TRY(step(Stage::LaunchBus, [this] {
    return mSupervisor.launchBus(busSpec(mConfig.bus));
  }));

  DESKBOOT_TRY(step(Stage::LaunchDisplayServer, [this] {
    return mSupervisor.launchDisplayServer(displayServerSpec(mConfig.display));
  }));

  DESKBOOT_TRY(step(Stage::LaunchSession, [this] {
    return mSupervisor.launchSession(desktopSessionSpec(mConfig.session),
                                     mConfig.display.display);
  }));

  return {};
}

} // namespace deskboot
