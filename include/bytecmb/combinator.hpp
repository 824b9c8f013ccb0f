/**
 * combinator.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * A base-type for all combinators. Implements duplication for the deriving
 * type, so combinators only have to provide parse().
 */

#ifndef BYTECMB_COMBINATOR_HPP
#define BYTECMB_COMBINATOR_HPP

#include <memory>
#include <type_traits>
#include "detail.hpp"
#include "parse_base.hpp"

namespace bytecmb {

/**
 * The actual type that all combinators derive from.
 * Self must be copy-constructible, copying it has to copy all sub-parsers.
 */
template <typename Self, typename T>
class combinator : public parse_base<T> {
public:
    [[nodiscard]] std::unique_ptr<parse_base<T>> clone() const override {
        static_assert(
            std::is_copy_constructible_v<Self>,
            "A combinator must be copy-constructible to be duplicated!"
        );
        return std::make_unique<Self>(static_cast<Self const&>(*this));
    }
};

} /* namespace bytecmb */

#endif /* BYTECMB_COMBINATOR_HPP */
