/**
 * require.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A combinator that only succeeds if a given predicate is true for the value
 * of the wrapped parser.
 */

#ifndef BYTECMB_PARSERS_REQUIRE_HPP
#define BYTECMB_PARSERS_REQUIRE_HPP

#include <functional>
#include <type_traits>
#include <utility>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

template <typename T, typename Pred>
class require_t : public combinator<require_t<T, Pred>, T> {
private:
    static_assert(
        std::is_invocable_v<Pred const&, T const&>,
        "The predicate must be invocable with the parser value!"
    );
    static_assert(
        std::is_convertible_v<std::invoke_result_t<Pred const&, T const&>, bool>,
        "The predicate must return a type that is convertible to bool!"
    );
    static_assert(
        detail::is_stateless_v<Pred>,
        "The predicate must be a function or a capture-less lambda!"
    );

    Pred      m_Predicate;
    parser<T> m_Parser;

public:
    template <typename PredFwd>
    require_t(PredFwd&& pred, parser<T> p)
        : m_Predicate(bytecmb_fwd(pred)), m_Parser(std::move(p)) {
    }

    [[nodiscard]] outcome<T>
    parse(std::size_t position, source const& src) const override {
        auto p_out = m_Parser.parse(position, src);
        if (p_out.is_failure()) {
            return p_out;
        }
        if (!std::invoke(m_Predicate, std::as_const(p_out.success().value()))) {
            // Rejected, the consumed input is given back
            return failure();
        }
        return p_out;
    }
};

template <typename Pred, typename T>
[[nodiscard]] parser<T> require(Pred&& pred, parser<T> p) {
    return make_parser<require_t<T, std::decay_t<Pred>>>(
        bytecmb_fwd(pred), std::move(p)
    );
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_REQUIRE_HPP */
