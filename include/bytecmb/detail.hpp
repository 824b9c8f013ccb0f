/**
 * detail.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Inclusion of all detail headers.
 */

#ifndef BYTECMB_DETAIL_HPP
#define BYTECMB_DETAIL_HPP

#include "detail/macros.hpp"
#include "detail/traits.hpp"

#endif /* BYTECMB_DETAIL_HPP */
