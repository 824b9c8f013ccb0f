/**
 * unit.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The value of parsers that match without producing anything.
 */

#ifndef BYTECMB_UNIT_HPP
#define BYTECMB_UNIT_HPP

namespace bytecmb {

struct unit {};

[[nodiscard]] constexpr bool operator==(unit, unit) noexcept {
    return true;
}

[[nodiscard]] constexpr bool operator!=(unit, unit) noexcept {
    return false;
}

} /* namespace bytecmb */

#endif /* BYTECMB_UNIT_HPP */
