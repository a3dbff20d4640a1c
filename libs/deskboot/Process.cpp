#include "deskboot/Process.h"

#include <deskboot/sys/file.h>
#include <deskboot/sys/pipe.h>
#include <deskboot/sys/process.h>

#include <csignal>
#include <cstdlib>

#include <unistd.h>

namespace deskboot {

namespace {

/// Everything `execve` needs, built before forking so the child only has to
/// make async signal safe calls.
class ExecImage {
public:
  ExecImage(std::filesystem::path executable,
            const std::vector<std::string>& argv,
            const Environment& env)
    : mExecutable(std::move(executable)), mArgs(argv), mEnv(env.entries()) {
    for (auto& arg : mArgs) {
      mArgv.push_back(arg.data());
    }
    mArgv.push_back(nullptr);

    for (auto& entry : mEnv) {
      mEnvp.push_back(entry.data());
    }
    mEnvp.push_back(nullptr);
  }

  ExecImage(const ExecImage&) = delete;
  ExecImage& operator=(const ExecImage&) = delete;

  [[noreturn]] void exec(const sys::FD& statusPipe) const noexcept {
    ::execve(mExecutable.c_str(), mArgv.data(), mEnvp.data());
    sys::reportExecFailure(statusPipe);
  }

  const std::filesystem::path& executable() const { return mExecutable; }

private:
  std::filesystem::path mExecutable;
  std::vector<std::string> mArgs;
  std::vector<std::string> mEnv;
  std::vector<char*> mArgv;
  std::vector<char*> mEnvp;
};

/// Child side setup: ignore hangups, clear the signal mask inherited from the
/// launcher and install the standard streams.
bool
setupChild(int in, int out, int err) noexcept {
  struct sigaction ignore {};
  ignore.sa_handler = SIG_IGN;
  sigemptyset(&ignore.sa_mask);
  if (::sigaction(SIGHUP, &ignore, nullptr) == -1) {
    return false;
  }

  sigset_t none;
  sigemptyset(&none);
  if (::sigprocmask(SIG_SETMASK, &none, nullptr) == -1) {
    return false;
  }

  return ::dup2(in, STDIN_FILENO) != -1 && ::dup2(out, STDOUT_FILENO) != -1 &&
         ::dup2(err, STDERR_FILENO) != -1;
}

ErrorOr<std::filesystem::path>
resolve(const ProcessSpec& spec, const Environment& env) {
  if (spec.argv.empty()) {
    return Error::make(spec.name + ": no command configured");
  }

  auto executable = findExecutable(spec.argv.front(), env);
  if (!executable.has_value()) {
    return Error::make(spec.name + ": " + spec.argv.front() +
                       ": command not found");
  }
  return *executable;
}

ErrorOr<sys::FD>
openDevNull() {
  return withContext(sys::open("/dev/null", O_RDONLY | O_CLOEXEC), "/dev/null");
}

bool
isExecutableFile(const std::filesystem::path& path) {
  std::error_code ec;
  return ::access(path.c_str(), X_OK) == 0 &&
         !std::filesystem::is_directory(path, ec);
}

} // namespace

std::optional<std::filesystem::path>
findExecutable(std::string_view name, const Environment& env) {
  if (name.empty()) {
    return std::nullopt;
  }

  if (name.find('/') != std::string_view::npos) {
    std::filesystem::path path(name);
    if (isExecutableFile(path)) {
      return path;
    }
    return std::nullopt;
  }

  const auto searchPath =
    env.get("PATH").value_or("/usr/local/bin:/usr/bin:/bin");
  std::string_view rest = searchPath;
  while (true) {
    auto colon = rest.find(':');
    auto dir = rest.substr(0, colon);

    // An empty component means the current directory.
    auto candidate =
      (dir.empty() ? std::filesystem::path(".") : std::filesystem::path(dir)) /
      std::string(name);
    if (isExecutableFile(candidate)) {
      return candidate;
    }

    if (colon == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(colon + 1);
  }

  return std::nullopt;
}

OptError<>
prepareLog(const ProcessSpec& spec) {
  if (spec.log.empty()) {
    return {};
  }

  if (spec.log.has_parent_path()) {
    const auto dir = spec.log.parent_path();
    DESKBOOT_TRY(withContext(sys::makeDirectories(dir), dir.string()));
  }

  if (spec.logMode == LogMode::TruncateRestricted) {
    auto fd = DESKBOOT_TRY(withContext(
      sys::openMode(spec.log.c_str(),
                    O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                    spec.logPermissions),
      spec.log.string()));

    // The mode passed to open is ignored for an existing file.
    DESKBOOT_TRY(
      withContext(sys::fchmod(fd, spec.logPermissions), spec.log.string()));
  }

  return {};
}

ErrorOr<sys::FD>
openLog(const ProcessSpec& spec) {
  if (spec.log.empty()) {
    return withContext(sys::open("/dev/null", O_WRONLY | O_CLOEXEC),
                       "/dev/null");
  }

  return withContext(sys::openMode(spec.log.c_str(),
                                   O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC,
                                   spec.logPermissions),
                     spec.log.string());
}

bool
PosixLauncher::isAvailable(const ProcessSpec& spec, const Environment& env) {
  return !spec.argv.empty() &&
         findExecutable(spec.argv.front(), env).has_value();
}

ErrorOr<pid_t>
PosixLauncher::spawn(const ProcessSpec& spec, const Environment& env) {
  const ExecImage image(DESKBOOT_TRY(resolve(spec, env)), spec.argv, env);

  DESKBOOT_TRY(prepareLog(spec));
  auto log = DESKBOOT_TRY(openLog(spec));
  auto devNull = DESKBOOT_TRY(openDevNull());

  auto pidPipe = DESKBOOT_TRY(withContext(sys::pipe(), "pipe"));
  auto statusPipe = DESKBOOT_TRY(withContext(sys::pipe(), "pipe"));

  auto pid = DESKBOOT_TRY(withContext(sys::fork(), spec.name + ": fork"));

  if (pid == 0) {
    // Intermediate child: leave the session of the launcher, then fork again
    // so the process is reparented once we exit.
    ::setsid();

    pid_t grandchild = ::fork();
    if (grandchild == -1) {
      sys::reportExecFailure(statusPipe.writePipe);
    }

    if (grandchild > 0) {
      (void)pidPipe.writePipe.writeValue(grandchild);
      ::_exit(EXIT_SUCCESS);
    }

    if (!setupChild(devNull.fd, log.fd, log.fd)) {
      sys::reportExecFailure(statusPipe.writePipe);
    }
    image.exec(statusPipe.writePipe);
  }

  pidPipe.writePipe.close();
  statusPipe.writePipe.close();

  auto grandchild = pidPipe.readPipe.readExact<pid_t>();
  auto intermediate =
    DESKBOOT_TRY(withContext(sys::waitFor(pid), spec.name + ": wait"));

  if (auto status = sys::readExecStatus(statusPipe.readPipe); !status) {
    return Error::make(spec.name + ": failed to execute " +
                         image.executable().string(),
                       status.error());
  }

  if (!grandchild.has_value()) {
    return Error::make(spec.name + ": launch failed, intermediate process " +
                       sys::to_string(intermediate));
  }

  return *grandchild;
}

ErrorOr<CapturedOutput>
PosixLauncher::capture(const ProcessSpec& spec, const Environment& env) {
  const ExecImage image(DESKBOOT_TRY(resolve(spec, env)), spec.argv, env);

  DESKBOOT_TRY(prepareLog(spec));
  auto log = DESKBOOT_TRY(openLog(spec));
  auto devNull = DESKBOOT_TRY(openDevNull());

  auto outPipe = DESKBOOT_TRY(withContext(sys::pipe(), "pipe"));
  auto statusPipe = DESKBOOT_TRY(withContext(sys::pipe(), "pipe"));

  auto pid = DESKBOOT_TRY(withContext(sys::fork(), spec.name + ": fork"));

  if (pid == 0) {
    // Anything this forks keeps running after the launcher exits.
    ::setsid();

    if (!setupChild(devNull.fd, outPipe.writePipe.fd, log.fd)) {
      sys::reportExecFailure(statusPipe.writePipe);
    }
    image.exec(statusPipe.writePipe);
  }

  outPipe.writePipe.close();
  statusPipe.writePipe.close();

  if (auto status = sys::readExecStatus(statusPipe.readPipe); !status) {
    // Reap the failed child before reporting.
    (void)sys::waitFor(pid);
    return Error::make(spec.name + ": failed to execute " +
                         image.executable().string(),
                       status.error());
  }

  auto output = outPipe.readPipe.readToEnd();
  auto exit =
    DESKBOOT_TRY(withContext(sys::waitFor(pid), spec.name + ": wait"));

  if (!output.has_value()) {
    return Error::make(spec.name + ": reading output", output.error());
  }

  if (!exit.success()) {
    return Error::make(spec.name + " " + sys::to_string(exit));
  }

  return CapturedOutput{ pid, std::move(*output) };
}

} // namespace deskboot
