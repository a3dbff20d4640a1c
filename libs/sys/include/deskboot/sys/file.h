#pragma once

#include "fd.h"

#include <fcntl.h>
#include <sys/stat.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace deskboot::sys {

constexpr auto open = SysCall<::open, Result<FD>(const char*, int)>{};
constexpr auto openMode =
  SysCall<::open, Result<FD>(const char*, int, mode_t)>{};

constexpr auto fchmod = SysCall<::fchmod, Result<void>(const FD&, mode_t)>{};
constexpr auto chmod = SysCall<::chmod, Result<void>(const char*, mode_t)>{};

constexpr auto symlink =
  SysCall<::symlink, Result<void>(const char*, const char*)>{};
constexpr auto rename =
  SysCall<::rename, Result<void>(const char*, const char*)>{};
constexpr auto unlink = SysCall<::unlink, Result<void>(const char*)>{};

/// Permission bits of `path`, without following a final symlink.
Result<mode_t>
permissions(const std::filesystem::path& path);

Result<std::string>
readFile(const std::filesystem::path& path);

Result<std::string>
readlink(const std::filesystem::path& path);

/// Creates `path` and all missing parents. Existing directories are fine.
Result<void>
makeDirectories(const std::filesystem::path& path);

} // namespace deskboot::sys
