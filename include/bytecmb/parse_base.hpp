/**
 * parse_base.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * The interface every parser implements.
 */

#ifndef BYTECMB_PARSE_BASE_HPP
#define BYTECMB_PARSE_BASE_HPP

#include <cstddef>
#include <memory>
#include "detail.hpp"
#include "outcome.hpp"
#include "source.hpp"

namespace bytecmb {

/**
 * The capability every parser has: attempt a match at a position and produce
 * an independent duplicate of itself.
 */
template <typename T>
class parse_base {
public:
    using value_type = T;

    virtual ~parse_base() = default;

    [[nodiscard]] virtual outcome<T>
    parse(std::size_t position, source const& src) const = 0;

    [[nodiscard]] virtual std::unique_ptr<parse_base> clone() const = 0;
};

} /* namespace bytecmb */

#endif /* BYTECMB_PARSE_BASE_HPP */
