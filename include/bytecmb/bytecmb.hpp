/**
 * bytecmb.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Top-level header that includes all (other top-level) source files.
 */

#ifndef BYTECMB_BYTECMB_HPP
#define BYTECMB_BYTECMB_HPP

#include "combinator.hpp"
#include "detail.hpp"
#include "outcome.hpp"
#include "parse_base.hpp"
#include "parser.hpp"
#include "parsers.hpp"
#include "source.hpp"
#include "unit.hpp"

#endif /* BYTECMB_BYTECMB_HPP */
