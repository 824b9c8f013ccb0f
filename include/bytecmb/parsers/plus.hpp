/**
 * plus.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Same as 'star', but it has to succeed at least once.
 */

#ifndef BYTECMB_PARSERS_PLUS_HPP
#define BYTECMB_PARSERS_PLUS_HPP

#include <utility>
#include <vector>
#include "star.hpp"

namespace bytecmb {

template <typename T>
class plus_t : public combinator<plus_t<T>, std::vector<T>> {
private:
    star_t<T> m_Parser;

public:
    explicit plus_t(parser<T> p) noexcept
        : m_Parser(std::move(p)) {
    }

    [[nodiscard]] outcome<std::vector<T>>
    parse(std::size_t position, source const& src) const override {
        auto p_out = m_Parser.parse(position, src);

        bytecmb_assert(
            "The underlying 'star' parser must always succeed!",
            p_out.is_success()
        );

        if (p_out.success().value().empty()) {
            return failure();
        }
        return p_out;
    }
};

template <typename T>
[[nodiscard]] parser<std::vector<T>> plus(parser<T> p) {
    return make_parser<plus_t<T>>(std::move(p));
}

/**
 * Operator for making a plus parser.
 */
template <typename T>
[[nodiscard]] parser<std::vector<T>> operator+(parser<T> p) {
    return plus(std::move(p));
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_PLUS_HPP */
