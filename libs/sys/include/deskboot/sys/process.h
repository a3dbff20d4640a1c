#pragma once

#include "fd.h"

#include <csignal>
#include <string>

#include <sys/types.h>
#include <sys/wait.h>

namespace deskboot::sys {

constexpr auto fork = SysCall<::fork, Result<pid_t>()>{};
constexpr auto kill = SysCall<::kill, Result<void>(pid_t, int)>{};

struct ExitStatus {
  enum { Exited, Signaled } type = Exited;
  int value = 0;

  [[nodiscard]] bool success() const { return type == Exited && value == 0; }
};

std::string
to_string(const ExitStatus& status); // NOLINT

/// Blocks until `pid` terminates, retrying on EINTR.
Result<ExitStatus>
waitFor(pid_t pid);

/// Returns the error the child wrote to `statusPipe` before failing to exec,
/// or success if the pipe was closed by a successful exec.
Result<void>
readExecStatus(const FD& statusPipe);

/// Child side of `readExecStatus`: reports errno and terminates. Only uses
/// async signal safe calls.
[[noreturn]] void
reportExecFailure(const FD& statusPipe) noexcept;

} // namespace deskboot::sys
