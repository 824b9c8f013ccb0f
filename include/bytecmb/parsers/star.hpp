/**
 * star.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A combinator that applies it's parser as many times as it can without
 * failing. Collects the results into a vector. Succeeds even when there are 0
 * matches.
 */

#ifndef BYTECMB_PARSERS_STAR_HPP
#define BYTECMB_PARSERS_STAR_HPP

#include <utility>
#include <vector>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

template <typename T>
class star_t : public combinator<star_t<T>, std::vector<T>> {
private:
    parser<T> m_Parser;

public:
    explicit star_t(parser<T> p) noexcept
        : m_Parser(std::move(p)) {
    }

    [[nodiscard]] outcome<std::vector<T>>
    parse(std::size_t position, source const& src) const override {
        auto cursor = position;
        auto values = std::vector<T>();
        while (true) {
            auto p_out = m_Parser.parse(cursor, src);
            if (p_out.is_failure()) {
                // Stop applying
                break;
            }
            auto p_succ = std::move(p_out).success();
            if (p_succ.position() == cursor) {
                // A match that consumed nothing would repeat forever
                break;
            }
            cursor = p_succ.position();
            values.push_back(std::move(p_succ).value());
        }
        return success(std::move(values), cursor);
    }
};

template <typename T>
[[nodiscard]] parser<std::vector<T>> star(parser<T> p) {
    return make_parser<star_t<T>>(std::move(p));
}

/**
 * Operator for making a star parser.
 */
template <typename T>
[[nodiscard]] parser<std::vector<T>> operator*(parser<T> p) {
    return star(std::move(p));
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_STAR_HPP */
