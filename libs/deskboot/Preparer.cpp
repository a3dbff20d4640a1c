#include "deskboot/Preparer.h"

#include <deskboot/sys/file.h>

#include <array>
#include <iostream>

namespace deskboot {

namespace {
constexpr mode_t runtime_dir_mode = 0700;
constexpr mode_t machine_id_mode = 0644;
} // namespace

OptError<>
prepareDirectories(const std::vector<std::filesystem::path>& dirs) {
  for (const auto& dir : dirs) {
    std::error_code ec;
    if (std::filesystem::is_directory(dir, ec)) {
      continue;
    }

    DESKBOOT_TRY(withContext(sys::makeDirectories(dir),
                             "Creating directory " + dir.string()));
    std::cout << "deskboot: created " << dir.string() << std::endl;
  }
  return {};
}

ErrorOr<std::string>
generateMachineId() {
  auto random = DESKBOOT_TRY(withContext(
    sys::open("/dev/urandom", O_RDONLY | O_CLOEXEC), "/dev/urandom"));

  std::array<unsigned char, 16> bytes{};
  auto size = DESKBOOT_TRY(
    withContext(random.readAll(bytes.data(), bytes.size()), "/dev/urandom"));
  if (size != bytes.size()) {
    return Error::make("/dev/urandom: short read");
  }

  constexpr std::string_view digits = "0123456789abcdef";
  std::string id;
  id.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    id.push_back(digits[byte >> 4]);
    id.push_back(digits[byte & 0xf]);
  }
  return id;
}

ErrorOr<bool>
ensureMachineId(const std::filesystem::path& path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    return false;
  }

  if (path.has_parent_path()) {
    DESKBOOT_TRY(withContext(sys::makeDirectories(path.parent_path()),
                             "Creating directory " +
                               path.parent_path().string()));
  }

  const auto id = DESKBOOT_TRY(generateMachineId());

  // O_EXCL keeps an id created in the meantime.
  auto fd = sys::openMode(
    path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, machine_id_mode);
  if (!fd.has_value()) {
    if (fd.error() == std::errc::file_exists) {
      return false;
    }
    return Error::make(path.string(), fd.error());
  }

  if (auto res = fd->writeAll(id + '\n'); !res) {
    fd->close();
    // Don't leave a truncated id behind.
    (void)sys::unlink(path.c_str());
    return Error::make(path.string(), res.error());
  }

  std::cout << "deskboot: generated machine id in " << path.string()
            << std::endl;
  return true;
}

OptError<>
ensureRuntimeDir(const std::filesystem::path& path) {
  DESKBOOT_TRY(withContext(sys::makeDirectories(path),
                           "Creating runtime directory " + path.string()));
  DESKBOOT_TRY(
    withContext(sys::chmod(path.c_str(), runtime_dir_mode), path.string()));
  return {};
}

OptError<>
prepareEnvironment(const EnvironmentConfig& config, Environment& env) {
  DESKBOOT_TRY(prepareDirectories(config.directories));

  if (!config.machineId.empty()) {
    DESKBOOT_TRY(ensureMachineId(config.machineId));
  }

  if (!config.runtimeDir.empty()) {
    DESKBOOT_TRY(ensureRuntimeDir(config.runtimeDir));
    env.set("XDG_RUNTIME_DIR", config.runtimeDir.string());
  }

  return {};
}

} // namespace deskboot
