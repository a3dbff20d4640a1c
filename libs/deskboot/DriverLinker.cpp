#include "deskboot/DriverLinker.h"

#include <deskboot/sys/file.h>

#include <algorithm>
#include <iostream>

#include <dirent.h>
#include <fnmatch.h>
#include <unistd.h>

namespace deskboot {

namespace {

tl::unexpected<DriverError>
ioError(const std::filesystem::path& path, std::errc err) {
  return tl::unexpected(
    DriverError{ DriverError::Io, path.string() + ": " + sys::to_string(err) });
}

} // namespace

ErrorOr<std::vector<std::filesystem::path>, DriverError>
findDriverCandidates(const std::filesystem::path& parent,
                     std::string_view pattern) {
  auto* dir = opendir(parent.c_str());
  if (dir == nullptr) {
    return ioError(parent, sys::getErrno());
  }

  const std::string glob(pattern);
  std::vector<std::filesystem::path> result;

  int readErr = 0;
  while (true) {
    errno = 0;
    auto* dirent = readdir(dir);
    if (dirent == nullptr) {
      readErr = errno;
      break;
    }

    std::string_view name = dirent->d_name;
    if (name == "." || name == "..") {
      continue;
    }

    // FNM_PERIOD: like the shell, `*` doesn't match a leading dot.
    if (fnmatch(glob.c_str(), dirent->d_name, FNM_PERIOD) != 0) {
      continue;
    }

    auto path = parent / name;
    std::error_code ec;
    if (!std::filesystem::is_directory(path, ec)) {
      std::cerr << "deskboot: skipping " << path.string()
                << ", not a directory" << std::endl;
      continue;
    }

    result.push_back(std::move(path));
  }

  closedir(dir);

  if (readErr != 0) {
    return ioError(parent, static_cast<std::errc>(readErr));
  }

  std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
    return a.filename().native() < b.filename().native();
  });
  return result;
}

ErrorOr<std::filesystem::path, DriverError>
selectDriver(const std::vector<std::filesystem::path>& candidates) {
  if (candidates.empty()) {
    return tl::unexpected(
      DriverError{ DriverError::NotFound, "no matching directory" });
  }

  if (candidates.size() > 1) {
    std::cerr << "deskboot: warning: " << candidates.size()
              << " driver directories found, using "
              << candidates.front().string()
              << ", ignoring:";
    for (auto it = std::next(candidates.begin()); it != candidates.end();
         ++it) {
      std::cerr << ' ' << it->string();
    }
    std::cerr << std::endl;
  }

  return candidates.front();
}

ErrorOr<void, DriverError>
replaceSymlink(const std::filesystem::path& target,
               const std::filesystem::path& alias) {
  if (alias.has_parent_path()) {
    if (auto res = sys::makeDirectories(alias.parent_path()); !res) {
      return ioError(alias.parent_path(), res.error());
    }
  }

  // Link under a temporary name and rename it over the alias, so the alias
  // always exists once it has been created.
  auto tmp = alias;
  tmp += ".deskboot-" + std::to_string(getpid());

  (void)sys::unlink(tmp.c_str());
  if (auto res = sys::symlink(target.c_str(), tmp.c_str()); !res) {
    return ioError(tmp, res.error());
  }

  if (auto res = sys::rename(tmp.c_str(), alias.c_str()); !res) {
    (void)sys::unlink(tmp.c_str());
    return ioError(alias, res.error());
  }

  return {};
}

ErrorOr<std::filesystem::path, DriverError>
linkDriver(const DriverConfig& config) {
  const auto candidates =
    DESKBOOT_TRY(findDriverCandidates(config.searchDir, config.pattern));

  auto target = selectDriver(candidates);
  if (!target.has_value()) {
    return tl::unexpected(DriverError{
      DriverError::NotFound,
      "no entry matching '" + config.pattern + "' in " +
        config.searchDir.string() });
  }

  DESKBOOT_TRY(replaceSymlink(*target, config.alias));

  std::cout << "deskboot: linked " << config.alias.string() << " -> "
            << target->string() << std::endl;
  return *target;
}

} // namespace deskboot
