/**
 * epsilon.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A parser that always succeeds with an empty result, without consuming.
 */

#ifndef BYTECMB_PARSERS_EPSILON_HPP
#define BYTECMB_PARSERS_EPSILON_HPP

#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"
#include "../unit.hpp"

namespace bytecmb {

class epsilon_t : public combinator<epsilon_t, unit> {
public:
    [[nodiscard]] outcome<unit>
    parse(std::size_t position, source const& /* src */) const override {
        return success(unit(), position);
    }
};

[[nodiscard]] inline parser<unit> epsilon() {
    return make_parser<epsilon_t>();
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_EPSILON_HPP */
