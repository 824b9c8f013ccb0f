/**
 * end.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Matches the end of the input.
 */

#ifndef BYTECMB_PARSERS_END_HPP
#define BYTECMB_PARSERS_END_HPP

#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"
#include "../unit.hpp"

namespace bytecmb {

class end_t : public combinator<end_t, unit> {
public:
    [[nodiscard]] outcome<unit>
    parse(std::size_t position, source const& src) const override {
        if (src.is_end(position)) {
            return success(unit(), position);
        }
        return failure();
    }
};

[[nodiscard]] inline parser<unit> end() {
    return make_parser<end_t>();
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_END_HPP */
