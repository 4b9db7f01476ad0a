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

#ifndef ORBINT_LOGGING_HPP
#define ORBINT_LOGGING_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

#include <fmt/core.h>
#include <fmt/format.h>

namespace orbint
{

// Verbosity of the orbint logger, from the most to the least verbose.
enum class log_level : std::int32_t { trace = 0, debug = 1, info = 2, warning = 3 };

namespace detail
{

void log_impl(log_level, const std::string &);

} // namespace detail

// Wall-clock timer used to report the duration of
// propagations, searches and scans.
class stopwatch
{
    using clock = std::chrono::steady_clock;
    clock::time_point m_start_tp = clock::now();

public:
    // Seconds since construction.
    [[nodiscard]] double elapsed_s() const;
};

void set_logger_level(log_level);
[[nodiscard]] log_level get_logger_level();

void set_logger_level_info();
void set_logger_level_debug();
void set_logger_level_trace();
void set_logger_level_warning();

template <typename... T>
void log_info(fmt::format_string<T...> fmt, T &&...args)
{
    detail::log_impl(log_level::info, fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T>
void log_debug(fmt::format_string<T...> fmt, T &&...args)
{
    detail::log_impl(log_level::debug, fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T>
void log_trace(fmt::format_string<T...> fmt, T &&...args)
{
    detail::log_impl(log_level::trace, fmt::format(fmt, std::forward<T>(args)...));
}

template <typename... T>
void log_warning(fmt::format_string<T...> fmt, T &&...args)
{
    detail::log_impl(log_level::warning, fmt::format(fmt, std::forward<T>(args)...));
}

} // namespace orbint

namespace fmt
{

// NOTE: a stopwatch formats as its elapsed time in seconds.
template <>
struct formatter<orbint::stopwatch> : formatter<double> {
    template <typename FormatContext>
    auto format(const orbint::stopwatch &sw, FormatContext &ctx) const -> decltype(ctx.out())
    {
        return formatter<double>::format(sw.elapsed_s(), ctx);
    }
};

} // namespace fmt

#endif
