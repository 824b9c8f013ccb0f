/**
 * traits.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Type-level helpers: the C++20 remove_cvref, the checks for the callables
 * that predicates and transformations accept, and the value type of a
 * transformation.
 */

#ifndef BYTECMB_DETAIL_TRAITS_HPP
#define BYTECMB_DETAIL_TRAITS_HPP

#include <type_traits>

namespace bytecmb {
namespace detail {

template <typename T>
using remove_cvref_t = std::remove_cv_t<std::remove_reference_t<T>>;

template <typename Fn>
inline constexpr bool is_function_pointer_v =
       std::is_pointer_v<Fn>
    && std::is_function_v<std::remove_pointer_t<Fn>>;

/**
 * A callable is stateless if it's a function pointer or an empty class type
 * (capture-less lambdas are empty). Stored state would make a parser depend
 * on something other than its input.
 */
template <typename Fn>
inline constexpr bool is_stateless_v =
       is_function_pointer_v<remove_cvref_t<Fn>>
    || (std::is_class_v<remove_cvref_t<Fn>>
     && std::is_empty_v<remove_cvref_t<Fn>>);

/**
 * Stands in for the value of a transformation that can't be invoked, so only
 * the static_assert below gets reported.
 */
struct not_invocable {};

/**
 * The value a transformation produces from the parser value. Instantiating it
 * with a function that doesn't accept T&& is a hard error with a readable
 * message instead of a substitution failure.
 */
template <typename T, typename Fn,
    bool = std::is_invocable_v<Fn const&, T&&>>
struct process_value {
    using type = remove_cvref_t<std::invoke_result_t<Fn const&, T&&>>;
};

template <typename T, typename Fn>
struct process_value<T, Fn, false> {
    static_assert(
        std::is_invocable_v<Fn const&, T&&>,
        "The given function must be invocable with the parser's successful "
        "value type! (note: the function's invocation must be const-qualified!)"
    );
    using type = not_invocable;
};

template <typename T, typename Fn>
using process_value_t = typename process_value<T, Fn>::type;

} /* namespace detail */
} /* namespace bytecmb */

#endif /* BYTECMB_DETAIL_TRAITS_HPP */
