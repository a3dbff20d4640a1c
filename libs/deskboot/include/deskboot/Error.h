#pragma once

#include <deskboot/sys/error.h>

#include <string>

#include <tl/expected.hpp>

namespace deskboot {

struct Error {
  std::string msg;

  static tl::unexpected<Error> make(std::string msg) {
    return tl::unexpected(Error{ std::move(msg) });
  }

  /// Prefixes a system error with what was being done, e.g. the path.
  static tl::unexpected<Error> make(std::string context, std::errc err) {
    return make(std::move(context) + ": " + sys::to_string(err));
  }

  Error(std::errc err) : msg(sys::to_string(err)) {}
  Error(std::string msg) : msg(std::move(msg)) {}
};

inline std::string
to_string(const Error& err) { // NOLINT
  return err.msg;
}

template<typename T, typename E = Error>
using ErrorOr = tl::expected<T, E>;

template<typename E = Error>
using OptError = tl::expected<void, E>;

/// Attaches `context` to the error of a system call result.
template<typename T>
ErrorOr<T>
withContext(sys::Result<T> result, std::string_view context) {
  if (!result.has_value()) {
    return Error::make(std::string(context), result.error());
  }
  if constexpr (std::is_void_v<T>) {
    return {};
  } else {
    return std::move(*result);
  }
}

} // namespace deskboot
