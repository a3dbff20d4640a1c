#pragma once

#include "Environment.h"
#include "Error.h"

#include <deskboot/sys/fd.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace deskboot {

enum class LogMode {
  /// Append to the log, creating it if needed.
  Append,
  /// Truncate the log and restrict its permissions before the launch, then
  /// append.
  TruncateRestricted,
};

/// Optional wait after a launch: the path has to appear within the timeout.
struct ReadinessProbe {
  std::filesystem::path path;
  std::chrono::milliseconds timeout{ 5000 };
};

struct ProcessSpec {
  std::string name;

  // argv[0] is the executable, looked up in PATH if it has no slash.
  std::vector<std::string> argv;

  std::filesystem::path log;
  LogMode logMode = LogMode::Append;
  mode_t logPermissions = 0644;

  std::optional<ReadinessProbe> ready;
};

struct CapturedOutput {
  pid_t pid = -1;
  std::string output;
};

/// Resolves an executable name against the `PATH` of `env`. Names containing
/// a slash are only checked for being executable.
std::optional<std::filesystem::path>
findExecutable(std::string_view name, const Environment& env);

/// Creates the parent directory of the log. For `TruncateRestricted` logs the
/// file is also truncated and its permissions set.
OptError<>
prepareLog(const ProcessSpec& spec);

/// Opens the log for appending, creating it with `spec.logPermissions`.
ErrorOr<sys::FD>
openLog(const ProcessSpec& spec);

/// Starts processes for the supervisor.
class ProcessLauncher {
public:
  virtual ~ProcessLauncher() = default;

  /// Whether the executable of `spec` can be found.
  virtual bool isAvailable(const ProcessSpec& spec, const Environment& env) = 0;

  /// Starts the process detached from the caller: new session, SIGHUP
  /// ignored, output to its log. Does not wait for it.
  /// \returns The pid of the started process.
  virtual ErrorOr<pid_t> spawn(const ProcessSpec& spec,
                               const Environment& env) = 0;

  /// Runs the process to completion and returns its standard output. Standard
  /// error goes to the log. Fails if it does not exit with status 0.
  virtual ErrorOr<CapturedOutput> capture(const ProcessSpec& spec,
                                          const Environment& env) = 0;
};

class PosixLauncher : public ProcessLauncher {
public:
  bool isAvailable(const ProcessSpec& spec, const Environment& env) override;
  ErrorOr<pid_t> spawn(const ProcessSpec& spec,
                       const Environment& env) override;
  ErrorOr<CapturedOutput> capture(const ProcessSpec& spec,
                                  const Environment& env) override;
};

} // namespace deskboot
