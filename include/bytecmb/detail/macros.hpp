/**
 * macros.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Macros shared by the headers: assertions, forwarding, SFINAE and getters.
 */

#ifndef BYTECMB_DETAIL_MACROS_HPP
#define BYTECMB_DETAIL_MACROS_HPP

#include <cassert>
#include <cstddef>
#include <type_traits>
#include <utility>
#include "traits.hpp"

/**
 * Precondition check that carries a message into the failed assertion output.
 * Disabled with NDEBUG.
 */
#define bytecmb_assert(msg, ...) assert(((void)msg, (__VA_ARGS__)))

/**
 * std::forward without repeating the type.
 */
#define bytecmb_fwd(...) ::std::forward<decltype(__VA_ARGS__)>(__VA_ARGS__)

/**
 * Template parameter that removes the template from overload resolution
 * unless the condition holds. The leading bool keeps the condition dependent.
 * At most one per template parameter list.
 */
#define bytecmb_requires_t(...)                                                \
bool bytecmb_req = false,                                                      \
::std::enable_if_t<bytecmb_req || (__VA_ARGS__), ::std::nullptr_t> = nullptr

/**
 * Declares is_self_v<U> in a class, true when U names the class itself. Keeps
 * forwarding constructors from hijacking copies.
 */
#define bytecmb_self_check(type)                                               \
template <typename bytecmb_self_t>                                             \
static constexpr bool is_self_v =                                              \
    ::std::is_same_v<::bytecmb::detail::remove_cvref_t<bytecmb_self_t>, type>

/**
 * Getter for an owned member. The rvalue overload moves the member out, so
 * std::move(outcome).success() doesn't copy.
 */
#define bytecmb_getter(name, ...)                                              \
[[nodiscard]]                                                                  \
constexpr auto& name() & noexcept(noexcept(__VA_ARGS__)) {                     \
    return __VA_ARGS__;                                                        \
}                                                                              \
[[nodiscard]]                                                                  \
constexpr auto const& name() const& noexcept(noexcept(__VA_ARGS__)) {          \
    return __VA_ARGS__;                                                        \
}                                                                              \
[[nodiscard]]                                                                  \
constexpr auto&& name() && noexcept(noexcept(__VA_ARGS__)) {                   \
    return ::std::move(__VA_ARGS__);                                           \
}

#endif /* BYTECMB_DETAIL_MACROS_HPP */
