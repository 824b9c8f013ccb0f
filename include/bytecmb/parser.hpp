/**
 * parser.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The owning handle that every combinator builds on. The handle has value
 * semantics: copying it duplicates the parser behind it.
 */

#ifndef BYTECMB_PARSER_HPP
#define BYTECMB_PARSER_HPP

#include <cstddef>
#include <memory>
#include <type_traits>
#include <utility>
#include "detail.hpp"
#include "outcome.hpp"
#include "parse_base.hpp"
#include "source.hpp"

namespace bytecmb {

template <typename T>
class parser;

// Forward-declare process for operator[], the definition is included at the
// end of this file
template <typename Fn, typename T>
[[nodiscard]] parser<detail::process_value_t<T, std::decay_t<Fn>>>
process(Fn&& fn, parser<T> p);

template <typename T>
class parser {
public:
    using value_type = T;
    using base_type = parse_base<T>;

private:
    std::unique_ptr<base_type> m_Impl;

public:
    explicit parser(std::unique_ptr<base_type> impl) noexcept
        : m_Impl(std::move(impl)) {
        bytecmb_assert(
            "A parser handle must be constructed from an existing parser!",
            m_Impl != nullptr
        );
    }

    parser(parser const& other)
        : m_Impl(other.m_Impl ? other.m_Impl->clone() : nullptr) {
    }

    parser(parser&& other) noexcept = default;

    parser& operator=(parser const& other) {
        parser(other).swap(*this);
        return *this;
    }

    parser& operator=(parser&& other) noexcept = default;

    void swap(parser& other) noexcept {
        m_Impl.swap(other.m_Impl);
    }

    [[nodiscard]] outcome<T> parse(std::size_t position, source const& src) const {
        bytecmb_assert(
            "A moved-from parser can't be invoked!",
            m_Impl != nullptr
        );
        bytecmb_assert(
            "The parse position must be in the bounds of the source!",
            position <= src.length()
        );
        return m_Impl->parse(position, src);
    }

    [[nodiscard]] outcome<T> parse(source const& src) const {
        return parse(0U, src);
    }

    /**
     * Transforms the successful value with the given function.
     */
    template <typename Fn>
    [[nodiscard]] auto operator[](Fn&& fn) const& {
        return process(bytecmb_fwd(fn), *this);
    }

    template <typename Fn>
    [[nodiscard]] auto operator[](Fn&& fn) && {
        return process(bytecmb_fwd(fn), std::move(*this));
    }
};

/**
 * Wraps a concrete parser type into a handle.
 */
template <typename P, typename... Args>
[[nodiscard]] parser<typename P::value_type> make_parser(Args&&... args) {
    static_assert(
        std::is_base_of_v<parse_base<typename P::value_type>, P>,
        "A parser must be derived from parse_base<T>!"
    );
    return parser<typename P::value_type>(
        std::make_unique<P>(bytecmb_fwd(args)...)
    );
}

} /* namespace bytecmb */

// operator[] instantiates process, so every header that reaches parser<T> has
// to see its definition
#include "parsers/process.hpp"

#endif /* BYTECMB_PARSER_HPP */
