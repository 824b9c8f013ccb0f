/**
 * concat.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A combinator that sequences parsers one after the other. Only applies the
 * next one if the previous succeeded. Collects the results into a vector.
 */

#ifndef BYTECMB_PARSERS_CONCAT_HPP
#define BYTECMB_PARSERS_CONCAT_HPP

#include <initializer_list>
#include <utility>
#include <vector>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

template <typename T>
class concat_t : public combinator<concat_t<T>, std::vector<T>> {
private:
    std::vector<parser<T>> m_Parsers;

public:
    explicit concat_t(std::vector<parser<T>> parsers) noexcept
        : m_Parsers(std::move(parsers)) {
    }

    [[nodiscard]] outcome<std::vector<T>>
    parse(std::size_t position, source const& src) const override {
        auto cursor = position;
        auto values = std::vector<T>();
        values.reserve(m_Parsers.size());
        for (auto const& p : m_Parsers) {
            auto p_out = p.parse(cursor, src);
            if (p_out.is_failure()) {
                // Early failure, don't continue
                return failure();
            }
            auto p_succ = std::move(p_out).success();
            cursor = p_succ.position();
            values.push_back(std::move(p_succ).value());
        }
        return success(std::move(values), cursor);
    }
};

template <typename T>
[[nodiscard]] parser<std::vector<T>> concat(std::vector<parser<T>> parsers) {
    return make_parser<concat_t<T>>(std::move(parsers));
}

template <typename T>
[[nodiscard]] parser<std::vector<T>>
concat(std::initializer_list<parser<T>> parsers) {
    return concat(std::vector<parser<T>>(parsers));
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_CONCAT_HPP */
