#pragma once

#include "error.h"
#include "traits.h"

#include <unistd.h>

#include <string>
#include <string_view>
#include <utility>

namespace deskboot::sys {

/// Owned file descriptor. Move only, closed on destruction.
struct FD {
  static constexpr int invalid_fd = -1;

  int fd = invalid_fd;

  explicit FD(int fd = invalid_fd) noexcept : fd(fd) {}
  FD(FD&& other) noexcept : fd(other.fd) { other.fd = invalid_fd; }

  FD& operator=(FD&& other) noexcept {
    std::swap(other.fd, fd);
    other.close();
    return *this;
  }

  ~FD() noexcept { close(); }

  void close() noexcept {
    if (fd >= 0) {
      ::close(fd);
    }
    fd = invalid_fd;
  }

  FD(const FD&) = delete;
  FD& operator=(const FD&) = delete;

  [[nodiscard]] bool isValid() const noexcept { return fd >= 0; }

  /// Reads until `size` bytes are read or EOF is reached.
  /// \returns The number of bytes read.
  [[nodiscard]] Result<std::size_t> readAll(void* buf, std::size_t size) const;

  /// Reads until EOF.
  [[nodiscard]] Result<std::string> readToEnd() const;

  template<typename T,
           typename = std::enable_if_t<std::is_trivially_copyable_v<T>>>
  [[nodiscard]] Result<T> readExact() const {
    T result{};
    auto size = readAll(&result, sizeof(T));
    if (!size.has_value()) {
      return tl::unexpected(size.error());
    }
    if (*size != sizeof(T)) {
      return tl::unexpected(eof_error);
    }
    return result;
  }

  [[nodiscard]] Result<void> writeAll(const void* buf, std::size_t size) const;

  [[nodiscard]] Result<void> writeAll(std::string_view str) const {
    return writeAll(str.data(), str.size());
  }

  template<typename T,
           typename = std::enable_if_t<std::is_trivially_copyable_v<T>>>
  [[nodiscard]] Result<void> writeValue(const T& t) const {
    return writeAll(&t, sizeof(T));
  }

  // ENODATA stands in for a short read.
  static constexpr std::errc eof_error = std::errc::no_message_available;
};

template<>
struct WrapperTraits<const FD&> {
  static int arg(const FD& fd) { return fd.fd; }
};

template<>
struct WrapperTraits<Result<FD>> {
  static Result<FD> ret(int res) {
    if (res == -1) {
      return tl::unexpected(getErrno());
    }
    return FD(res);
  }
};

} // namespace deskboot::sys
