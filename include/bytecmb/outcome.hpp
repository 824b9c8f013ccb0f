/**
 * outcome.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A generic Either-like type that's either a parse success or a parse failure.
 * Just like std::variant<A, B> but with type-constructors.
 */

#ifndef BYTECMB_OUTCOME_HPP
#define BYTECMB_OUTCOME_HPP

#include <cstddef>
#include <type_traits>
#include <variant>
#include "detail.hpp"

namespace bytecmb {

/**
 * Success "type-constructor". The type that the parser returns when it
 * succeeded. The position is the cursor right after the consumed input.
 */
template <typename T>
class success {
public:
    using value_type = T;

private:
    value_type  m_Value;
    std::size_t m_Position;

public:
    template <typename TFwd>
    constexpr success(TFwd&& val, std::size_t position)
        noexcept(std::is_nothrow_constructible_v<value_type, TFwd&&>)
        : m_Value(bytecmb_fwd(val)), m_Position(position) {
    }

    bytecmb_getter(value, m_Value)

    [[nodiscard]] constexpr auto const& position() const noexcept {
        return m_Position;
    }
};

template <typename TFwd>
success(TFwd, std::size_t) -> success<TFwd>;

/**
 * Failure "type-constructor". The type that the parser returns when it fails.
 * It carries no data, a failure only means there was no match.
 */
class failure { };

/**
 * The outcome of a parse. It's either a success or a failure type.
 */
template <typename T>
class outcome {
public:
    using value_type = T;
    using success_type = ::bytecmb::success<T>;
    using failure_type = ::bytecmb::failure;

private:
    bytecmb_self_check(outcome);

    using either_type = std::variant<success_type, failure_type>;

    either_type m_Data;

public:
    template <typename TFwd, bytecmb_requires_t(!is_self_v<TFwd>)>
    constexpr outcome(TFwd&& val)
        noexcept(std::is_nothrow_constructible_v<either_type, TFwd&&>)
        : m_Data(bytecmb_fwd(val)) {
    }

    [[nodiscard]] constexpr bool is_success() const noexcept {
        return std::holds_alternative<success_type>(m_Data);
    }

    [[nodiscard]] constexpr bool is_failure() const noexcept {
        return std::holds_alternative<failure_type>(m_Data);
    }

    bytecmb_getter(success, std::get<success_type>(m_Data))
    bytecmb_getter(failure, std::get<failure_type>(m_Data))
};

template <typename T>
[[nodiscard]] constexpr bool operator==(
    success<T> const& lhs, success<T> const& rhs) {

    return lhs.position() == rhs.position() && lhs.value() == rhs.value();
}

[[nodiscard]] constexpr bool operator==(failure, failure) noexcept {
    return true;
}

template <typename T>
[[nodiscard]] constexpr bool operator==(
    outcome<T> const& lhs, outcome<T> const& rhs) {

    if (lhs.is_failure() || rhs.is_failure()) {
        return lhs.is_failure() && rhs.is_failure();
    }
    return lhs.success() == rhs.success();
}

template <typename T>
[[nodiscard]] constexpr bool operator!=(
    outcome<T> const& lhs, outcome<T> const& rhs) {

    return !(lhs == rhs);
}

} /* namespace bytecmb */

#endif /* BYTECMB_OUTCOME_HPP */
