#pragma once

#include <tuple>

namespace deskboot::sys {

/// Specialize this trait to map an argument or return type of a wrapped call
/// to and from the C API.
template<typename T>
struct WrapperTraits {
  static T arg(T t) { return t; }
  static T ret(T t) { return t; }
};

namespace details {
template<typename T>
struct Flatten {
  static std::tuple<T> flatten(T t) { return t; }
};

template<typename... Ts>
struct Flatten<std::tuple<Ts...>> {
  static std::tuple<Ts...> flatten(std::tuple<Ts...> t) { return t; }
};
} // namespace details

template<auto, class>
struct SysCall;

/// Wraps a libc function with a typed signature. Arguments are converted with
/// `WrapperTraits<Arg>::arg`, the raw return value with
/// `WrapperTraits<Res>::ret`.
template<auto Fn, typename Res, typename... Args>
struct SysCall<Fn, Res(Args...)> {
  [[nodiscard]] auto operator()(Args... args) const noexcept {
    auto raw = std::tuple_cat(
      details::Flatten<decltype(WrapperTraits<Args>::arg(args))>::flatten(
        WrapperTraits<Args>::arg(args))...);
    return WrapperTraits<Res>::ret(std::apply(Fn, std::move(raw)));
  }
};

} // namespace deskboot::sys
