#pragma once

#include <deskboot/Process.h>

#include <set>
#include <string>
#include <vector>

/// Records launches instead of starting anything.
struct FakeLauncher : deskboot::ProcessLauncher {
  struct Call {
    enum { Spawn, Capture } type;
    deskboot::ProcessSpec spec;
    deskboot::Environment env;
  };

  bool isAvailable(const deskboot::ProcessSpec& spec,
                   const deskboot::Environment& env) override {
    return !spec.argv.empty() && missing.count(spec.argv.front()) == 0;
  }

  deskboot::ErrorOr<pid_t> spawn(const deskboot::ProcessSpec& spec,
                                 const deskboot::Environment& env) override {
    calls.push_back(Call{ Call::Spawn, spec, env });
    if (failing.count(spec.name) != 0) {
      return deskboot::Error::make(spec.name + ": failed to execute");
    }
    return nextPid++;
  }

  deskboot::ErrorOr<deskboot::CapturedOutput> capture(
    const deskboot::ProcessSpec& spec,
    const deskboot::Environment& env) override {
    calls.push_back(Call{ Call::Capture, spec, env });
    if (failing.count(spec.name) != 0) {
      return deskboot::Error::make(spec.name + " exited with status 1");
    }
    return deskboot::CapturedOutput{ nextPid++, captureOutput };
  }

  std::vector<Call> calls;

  // Executables reported as not installed.
  std::set<std::string> missing;
  // Names of the specs that fail to launch.
  std::set<std::string> failing;

  std::string captureOutput;
  pid_t nextPid = 100;
};
