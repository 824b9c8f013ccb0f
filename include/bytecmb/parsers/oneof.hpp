/**
 * oneof.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A combinator that tries the alternatives in order, each at the same
 * position. The first one that succeeds wins.
 */

#ifndef BYTECMB_PARSERS_ONEOF_HPP
#define BYTECMB_PARSERS_ONEOF_HPP

#include <initializer_list>
#include <utility>
#include <vector>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

template <typename T>
class oneof_t : public combinator<oneof_t<T>, T> {
private:
    std::vector<parser<T>> m_Parsers;

public:
    explicit oneof_t(std::vector<parser<T>> parsers) noexcept
        : m_Parsers(std::move(parsers)) {
    }

    [[nodiscard]] outcome<T>
    parse(std::size_t position, source const& src) const override {
        for (auto const& p : m_Parsers) {
            auto p_out = p.parse(position, src);
            if (p_out.is_success()) {
                return p_out;
            }
        }
        // All of them failed, or there were no alternatives
        return failure();
    }
};

template <typename T>
[[nodiscard]] parser<T> oneof(std::vector<parser<T>> parsers) {
    return make_parser<oneof_t<T>>(std::move(parsers));
}

template <typename T>
[[nodiscard]] parser<T> oneof(std::initializer_list<parser<T>> parsers) {
    return oneof(std::vector<parser<T>>(parsers));
}

/**
 * Operator for making alternatives.
 */
template <typename T>
[[nodiscard]] parser<T> operator|(parser<T> p1, parser<T> p2) {
    auto parsers = std::vector<parser<T>>();
    parsers.reserve(2U);
    parsers.push_back(std::move(p1));
    parsers.push_back(std::move(p2));
    return oneof(std::move(parsers));
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_ONEOF_HPP */
