/**
 * parsers.hpp
 *
 * Copyright (c) 2018-2019 Peter Lenkefi
 * Distributed under the MIT License.
 *
 * Inclusion of all parser headers.
 */

#ifndef BYTECMB_PARSERS_HPP
#define BYTECMB_PARSERS_HPP

#include "parsers/concat.hpp"
#include "parsers/end.hpp"
#include "parsers/epsilon.hpp"
#include "parsers/oneof.hpp"
#include "parsers/opt.hpp"
#include "parsers/plus.hpp"
#include "parsers/process.hpp"
#include "parsers/readchar.hpp"
#include "parsers/require.hpp"
#include "parsers/star.hpp"
#include "parsers/tag.hpp"

#endif /* BYTECMB_PARSERS_HPP */
