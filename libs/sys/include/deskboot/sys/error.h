#pragma once

#include "traits.h"

#include <tl/expected.hpp>

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>

namespace deskboot::sys::details {
template<typename T, typename E>
constexpr auto
takeValue(tl::expected<T, E> v) {
  if constexpr (std::is_same_v<T, void>) {
    (void)v;
    return;
  } else {
    return std::move(*v);
  }
}
} // namespace deskboot::sys::details

/// Evaluates `x`, returning its error from the enclosing function if it holds
/// one and yielding the contained value otherwise.
// NOLINTNEXTLINE
#define DESKBOOT_TRY(x)                                                        \
  ({                                                                           \
    auto&& resultOrErr = x;                                                    \
    if (!resultOrErr.has_value()) {                                            \
      return tl::unexpected(resultOrErr.error());                              \
    };                                                                         \
    ::deskboot::sys::details::takeValue(std::move(resultOrErr));               \
  })

namespace deskboot::sys {

template<typename T>
using Result = tl::expected<T, std::errc>;

[[nodiscard]] inline std::errc
getErrno() {
  return static_cast<std::errc>(errno);
}

inline std::string
to_string(std::errc error) { // NOLINT
  return std::make_error_code(error).message();
}

template<typename T>
struct WrapperTraits<Result<T>> {
  static_assert(std::is_integral_v<T>,
                "Provide an explicit wrapper trait for non integral results");

  static Result<T> ret(T res) {
    if (res == -1) {
      return tl::unexpected(getErrno());
    }
    return res;
  }
};

template<>
struct WrapperTraits<Result<void>> {
  static Result<void> ret(int res) {
    if (res == -1) {
      return tl::unexpected(getErrno());
    }
    return {};
  }
};

} // namespace deskboot::sys
