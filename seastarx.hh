/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <fmt/ostream.h> // remove once all seastar types can be formatted via formatter
#include <seastar/core/sstring.hh>
#include <seastar/util/log.hh>

namespace seastar {

template <typename T>
class shared_ptr;

template <typename T>
class lw_shared_ptr;

}

using namespace seastar;
using seastar::shared_ptr;
using seastar::sstring;

template <> struct fmt::formatter<seastar::log_level> : fmt::ostream_formatter {};
