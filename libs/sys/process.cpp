#include "deskboot/sys/process.h"

#include <cstring>

namespace deskboot::sys {

std::string
to_string(const ExitStatus& status) { // NOLINT
  if (status.type == ExitStatus::Signaled) {
    return std::string("killed by signal ") + strsignal(status.value);
  }
  return "exited with status " + std::to_string(status.value);
}

Result<ExitStatus>
waitFor(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) == -1) {
    if (errno != EINTR) {
      return tl::unexpected(getErrno());
    }
  }

  if (WIFSIGNALED(status)) {
    return ExitStatus{ ExitStatus::Signaled, WTERMSIG(status) };
  }
  return ExitStatus{ ExitStatus::Exited, WEXITSTATUS(status) };
}

Result<void>
readExecStatus(const FD& statusPipe) {
  int childErrno = 0;
  auto size = DESKBOOT_TRY(statusPipe.readAll(&childErrno, sizeof(childErrno)));
  if (size == 0) {
    // Closed on exec.
    return {};
  }
  if (size != sizeof(childErrno)) {
    return tl::unexpected(FD::eof_error);
  }
  return tl::unexpected(static_cast<std::errc>(childErrno));
}

void
reportExecFailure(const FD& statusPipe) noexcept {
  int err = errno;
  // Nothing left to do if the parent went away.
  (void)::write(statusPipe.fd, &err, sizeof(err));
  ::_exit(127);
}

} // namespace deskboot::sys
