#ifndef MCPLINK_CORE_COMPAT_H
#define MCPLINK_CORE_COMPAT_H

// Vocabulary types used across mcplink. The library is built as C++17, so
// these resolve to the std:: types; the aliases keep call sites short and
// give one place to hang the visitation helpers.

#include <optional>
#include <utility>
#include <variant>

namespace mcplink {

template <typename T>
using optional = std::optional<T>;

using nullopt_t = std::nullopt_t;
inline constexpr auto nullopt = std::nullopt;

using std::make_optional;

template <typename... Types>
using variant = std::variant<Types...>;

using std::get;
using std::get_if;
using std::holds_alternative;
using std::visit;

// Overload set for std::visit. A visitor built from make_overload that misses
// an alternative fails to compile, which is what we rely on for exhaustive
// transport dispatch.
template <typename... Fs>
struct overload_impl : Fs... {
  using Fs::operator()...;
};

template <typename... Fs>
overload_impl(Fs...) -> overload_impl<Fs...>;

template <typename... Fs>
overload_impl<Fs...> make_overload(Fs... fs) {
  return overload_impl<Fs...>{std::move(fs)...};
}

// Helper for variant visitation with type safety
template <typename Variant, typename... Visitors>
decltype(auto) match(Variant&& v, Visitors&&... visitors) {
  return visit(make_overload(std::forward<Visitors>(visitors)...),
               std::forward<Variant>(v));
}

}  // namespace mcplink

#endif  // MCPLINK_CORE_COMPAT_H
