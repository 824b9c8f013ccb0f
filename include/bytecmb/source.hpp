/**
 * source.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The byte source that the parsers read. It's a non-owning view, the bytes are
 * owned by the caller for the duration of the parse.
 */

#ifndef BYTECMB_SOURCE_HPP
#define BYTECMB_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include "detail.hpp"

namespace bytecmb {

/**
 * The element type of every source.
 */
using byte = std::uint8_t;

class source {
private:
    byte const* m_Data;
    std::size_t m_Length;

public:
    constexpr source() noexcept
        : m_Data(nullptr), m_Length(0U) {
    }

    constexpr source(byte const* data, std::size_t length) noexcept
        : m_Data(data), m_Length(length) {
        bytecmb_assert(
            "A source with a non-zero length must point to some data!",
            data != nullptr || length == 0U
        );
    }

    source(std::string_view str) noexcept
        : source(reinterpret_cast<byte const*>(str.data()), str.size()) {
    }

    source(char const* str) noexcept
        : source(std::string_view(str)) {
    }

    source(std::string const& str) noexcept
        : source(std::string_view(str)) {
    }

    source(std::vector<byte> const& bytes) noexcept
        : source(bytes.data(), bytes.size()) {
    }

    // Just to avoid nasty bugs
    source(std::string&&) = delete;
    source(std::vector<byte>&&) = delete;

    [[nodiscard]] constexpr byte const* data() const noexcept {
        return m_Data;
    }

    [[nodiscard]] constexpr std::size_t length() const noexcept {
        return m_Length;
    }

    [[nodiscard]] constexpr bool is_end(std::size_t position) const noexcept {
        return position >= length();
    }

    [[nodiscard]] constexpr byte const& at(std::size_t position) const noexcept {
        bytecmb_assert(
            "at() can only be invoked with a position that is not past the "
            "elements!",
            position < length()
        );
        return m_Data[position];
    }
};

} /* namespace bytecmb */

#endif /* BYTECMB_SOURCE_HPP */
