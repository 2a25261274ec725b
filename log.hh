/*
 * Copyright (C) 2026-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#pragma once

#include <fmt/format.h>
#include <seastar/util/log.hh>

namespace logging {

using log_level = seastar::log_level;
using logger = seastar::logger;

}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_and_throw(seastar::logger& logger, seastar::log_level log_level, fmt::format_string<Args...> fmt, Args&&... args) {
    auto msg = fmt::format(fmt, std::forward<Args>(args)...);
    logger.log(log_level, "{}", msg);
    throw ExceptionType(msg);
}

template <typename ExceptionType, typename... Args>
[[noreturn]] void log_error_and_throw(seastar::logger& logger, fmt::format_string<Args...> fmt, Args&&... args) {
    log_and_throw<ExceptionType>(logger, seastar::log_level::error, fmt, std::forward<Args>(args)...);
}
