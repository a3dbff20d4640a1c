#include "deskboot/sys/file.h"

#include <unistd.h>

#include <climits>
#include <vector>

namespace deskboot::sys {

Result<mode_t>
permissions(const std::filesystem::path& path) {
  struct stat st {};
  if (::lstat(path.c_str(), &st) == -1) {
    return tl::unexpected(getErrno());
  }
  return st.st_mode & 07777;
}

Result<std::string>
readFile(const std::filesystem::path& path) {
  auto fd = DESKBOOT_TRY(open(path.c_str(), O_RDONLY | O_CLOEXEC));
  return fd.readToEnd();
}

Result<std::string>
readlink(const std::filesystem::path& path) {
  std::vector<char> buf(PATH_MAX);
  auto size = ::readlink(path.c_str(), buf.data(), buf.size());
  if (size == -1) {
    return tl::unexpected(getErrno());
  }
  return std::string(buf.data(), size);
}

Result<void>
makeDirectories(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return tl::unexpected(static_cast<std::errc>(ec.value()));
  }

  // create_directories reports success for an existing non-directory.
  if (!std::filesystem::is_directory(path, ec)) {
    return tl::unexpected(std::errc::not_a_directory);
  }
  return {};
}

} // namespace deskboot::sys
