#include "deskboot/sys/fd.h"

#include <array>

namespace deskboot::sys {

Result<std::size_t>
FD::readAll(void* buf, std::size_t size) const {
  std::size_t read = 0;
  while (read < size) {
    // NOLINTNEXTLINE
    auto res = ::read(fd, reinterpret_cast<char*>(buf) + read, size - read);
    if (res == -1) {
      if (errno == EINTR) {
        continue;
      }
      return tl::unexpected(getErrno());
    }

    if (res == 0) {
      break;
    }

    read += res;
  }

  return read;
}

Result<std::string>
FD::readToEnd() const {
  std::string result;
  std::array<char, 4096> chunk{};

  while (true) {
    auto size = DESKBOOT_TRY(readAll(chunk.data(), chunk.size()));
    result.append(chunk.data(), size);
    if (size < chunk.size()) {
      return result;
    }
  }
}

Result<void>
FD::writeAll(const void* buf, std::size_t size) const {
  std::size_t written = 0;
  while (written < size) {
    auto res = // NOLINTNEXTLINE
      ::write(fd, reinterpret_cast<const char*>(buf) + written, size - written);
    if (res == -1) {
      if (errno == EINTR) {
        continue;
      }
      return tl::unexpected(getErrno());
    }

    written += res;
  }

  return {};
}

} // namespace deskboot::sys
