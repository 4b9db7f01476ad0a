// Copyright 2024-2025 Francesco Biscani
//
// This file is part of the orbint library.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU Affero General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU Affero General Public License for more details.
//
// You should have received a copy of the GNU Affero General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "logging.hpp"

namespace orbint
{

namespace detail
{

namespace
{

spdlog::logger *get_logger()
{
    // NOTE: created on first use and shared by all the threads
    // running the parallel loops, hence the _mt sink.
    static auto ret = [] {
        auto logger = spdlog::stdout_color_mt("orbint");
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);

        return logger;
    }();

    return ret.get();
}

spdlog::level::level_enum to_spdlog(log_level l)
{
    switch (l) {
        case log_level::trace:
            return spdlog::level::trace;
        case log_level::debug:
            return spdlog::level::debug;
        case log_level::info:
            return spdlog::level::info;
        case log_level::warning:
            return spdlog::level::warn;
    }

    // LCOV_EXCL_START
    throw std::invalid_argument(fmt::format("Invalid logger level {}", static_cast<std::int32_t>(l)));
    // LCOV_EXCL_STOP
}

} // namespace

void log_impl(log_level l, const std::string &msg)
{
    get_logger()->log(to_spdlog(l), msg);
}

} // namespace detail

void set_logger_level(log_level l)
{
    detail::get_logger()->set_level(detail::to_spdlog(l));
}

log_level get_logger_level()
{
    switch (detail::get_logger()->level()) {
        case spdlog::level::trace:
            return log_level::trace;
        case spdlog::level::debug:
            return log_level::debug;
        case spdlog::level::info:
            return log_level::info;
        default:
            // NOTE: the levels above warning are never set by orbint.
            return log_level::warning;
    }
}

void set_logger_level_info()
{
    set_logger_level(log_level::info);
}

void set_logger_level_debug()
{
    set_logger_level(log_level::debug);
}

void set_logger_level_trace()
{
    set_logger_level(log_level::trace);
}

void set_logger_level_warning()
{
    set_logger_level(log_level::warning);
}

double stopwatch::elapsed_s() const
{
    return std::chrono::duration<double>(clock::now() - m_start_tp).count();
}

} // namespace orbint
