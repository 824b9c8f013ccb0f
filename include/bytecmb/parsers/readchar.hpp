/**
 * readchar.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Consumes a single byte from the input, if there is one.
 */

#ifndef BYTECMB_PARSERS_READCHAR_HPP
#define BYTECMB_PARSERS_READCHAR_HPP

#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

class readchar_t : public combinator<readchar_t, byte> {
public:
    [[nodiscard]] outcome<byte>
    parse(std::size_t position, source const& src) const override {
        if (src.is_end(position)) {
            // Nothing to consume
            return failure();
        }
        return success(src.at(position), position + 1U);
    }
};

[[nodiscard]] inline parser<byte> readchar() {
    return make_parser<readchar_t>();
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_READCHAR_HPP */
