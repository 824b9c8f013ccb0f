/**
 * tag.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Matches a literal byte string at the current position.
 */

#ifndef BYTECMB_PARSERS_TAG_HPP
#define BYTECMB_PARSERS_TAG_HPP

#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>
#include "../combinator.hpp"
#include "../outcome.hpp"
#include "../parser.hpp"

namespace bytecmb {

class tag_t : public combinator<tag_t, std::vector<byte>> {
private:
    std::vector<byte> m_Literal;

public:
    explicit tag_t(std::vector<byte> literal)
        : m_Literal(std::move(literal)) {
    }

    [[nodiscard]] outcome<std::vector<byte>>
    parse(std::size_t position, source const& src) const override {
        auto const len = m_Literal.size();
        if (src.length() - position < len) {
            // Not enough input left
            return failure();
        }
        for (std::size_t i = 0; i < len; ++i) {
            if (src.at(position + i) != m_Literal[i]) {
                return failure();
            }
        }
        return success(m_Literal, position + len);
    }
};

[[nodiscard]] inline parser<std::vector<byte>> tag(std::vector<byte> literal) {
    return make_parser<tag_t>(std::move(literal));
}

[[nodiscard]] inline parser<std::vector<byte>> tag(std::string_view literal) {
    return tag(std::vector<byte>(literal.begin(), literal.end()));
}

[[nodiscard]] inline parser<std::vector<byte>> tag(char const* literal) {
    return tag(std::string_view(literal));
}

} /* namespace bytecmb */

#endif /* BYTECMB_PARSERS_TAG_HPP */
