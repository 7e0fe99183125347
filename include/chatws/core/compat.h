#ifndef CHATWS_COMPAT_H
#define CHATWS_COMPAT_H

// std::optional / std::variant aliases used throughout chatws

#include <cstddef>
#include <optional>
#include <variant>

namespace chatws {

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

}  // namespace chatws

#endif  // CHATWS_COMPAT_H
