/**
 * process.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The transformation combinator that maps the successful value with a
 * user-provided function. The position stays the one of the wrapped parser.
 */

#ifndef BYTECMB_PARSERS_PROCESS_HPP
#define BYTECMB_PARSERS_PROCESS_HPP

#include <functional>
#include <type_traits>
#include <utility>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

template <typename T, typename Fn>
class process_t
    : public combinator<process_t<T, Fn>, detail::process_value_t<T, Fn>> {
public:
    using value_type = detail::process_value_t<T, Fn>;

private:
    static_assert(
        detail::is_stateless_v<Fn>,
        "The given function must be a function or a capture-less lambda!"
    );

    Fn        m_Fn;
    parser<T> m_Parser;

public:
    template <typename FnFwd>
    process_t(FnFwd&& fn, parser<T> p)
        : m_Fn(bytecmb_fwd(fn)), m_Parser(std::move(p)) {
    }

    [[nodiscard]] outcome<value_type>
    parse(std::size_t position, source const& src) const override {
        auto p_out = m_Parser.parse(position, src);
        if (p_out.is_failure()) {
            // Early failure
            return failure();
        }
        auto p_succ = std::move(p_out).success();
        auto const next = p_succ.position();
        return success<value_type>(
            std::invoke(m_Fn, std::move(p_succ).value()),
            next
        );
    }
};

template <typename Fn, typename T>
[[nodiscard]] parser<detail::process_value_t<T, std::decay_t<Fn>>>
process(Fn&& fn, parser<T> p) {
    return make_parser<process_t<T, std::decay_t<Fn>>>(
        bytecmb_fwd(fn), std::move(p)
    );
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_PROCESS_HPP */
