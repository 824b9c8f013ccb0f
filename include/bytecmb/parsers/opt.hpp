/**
 * opt.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Makes a parser optional. Always succeeds, but only consumes if the wrapped
 * parser matched.
 */

#ifndef BYTECMB_PARSERS_OPT_HPP
#define BYTECMB_PARSERS_OPT_HPP

#include <optional>
#include <utility>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

template <typename T>
class opt_t : public combinator<opt_t<T>, std::optional<T>> {
private:
    parser<T> m_Parser;

public:
    explicit opt_t(parser<T> p) noexcept
        : m_Parser(std::move(p)) {
    }

    [[nodiscard]] outcome<std::optional<T>>
    parse(std::size_t position, source const& src) const override {
        using value_t = std::optional<T>;

        auto p_out = m_Parser.parse(position, src);
        if (p_out.is_failure()) {
            return success(value_t(), position);
        }
        auto p_succ = std::move(p_out).success();
        auto const next = p_succ.position();
        return success(value_t(std::move(p_succ).value()), next);
    }
};

template <typename T>
[[nodiscard]] parser<std::optional<T>> opt(parser<T> p) {
    return make_parser<opt_t<T>>(std::move(p));
}

/**
 * Operator for making an optional parser.
 */
template <typename T>
[[nodiscard]] parser<std::optional<T>> operator-(parser<T> p) {
    return opt(std::move(p));
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_OPT_HPP */
