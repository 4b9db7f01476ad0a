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

#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "julian.hpp"

namespace orbint
{

namespace detail
{

namespace
{

// Julian date of the adoption of the Gregorian calendar (1582-10-15).
constexpr double gregorian_reform_jd = 2'299'160.5;

bool is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

// NOTE: month in the [1, 12] range.
int days_in_month(int year, int month)
{
    constexpr int mdays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

    return (month == 2 && is_leap_year(year)) ? 29 : mdays[month - 1];
}

} // namespace

} // namespace detail

double calendar_to_jd(int year, int month, int day, int hour, int minute, double second)
{
    if (month < 1 || month > 12 || day < 1 || day > detail::days_in_month(year, month) || hour < 0 || hour > 23
        || minute < 0 || minute > 59 || !std::isfinite(second) || second < 0 || second > 60) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Invalid calendar date {:04}-{:02}-{:02} {:02}:{:02}:{}", year, month,
                                                day, hour, minute, second));
    }

    // NOTE: algorithm from Meeus, Astronomical Algorithms, chapter 7.
    auto y = static_cast<double>(year);
    auto m = static_cast<double>(month);
    if (month <= 2) {
        y -= 1;
        m += 12;
    }

    const auto A = std::floor(y / 100);
    const auto B = 2 - A + std::floor(A / 4);

    const auto ret = std::floor(365.25 * (y + 4716)) + std::floor(30.6001 * (m + 1)) + day + B - 1524.5
                     + (hour + minute / 60. + second / 3600.) / 24.;

    if (ret < detail::gregorian_reform_jd) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The calendar date {:04}-{:02}-{:02} precedes the Gregorian calendar reform", year, month, day));
    }

    return ret;
}

double calendar_to_jd(const calendar_date &d)
{
    return calendar_to_jd(d.year, d.month, d.day, d.hour, d.minute, d.second);
}

calendar_date jd_to_calendar(double jd)
{
    if (!std::isfinite(jd) || jd < detail::gregorian_reform_jd) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Cannot convert the Julian date {} into a Gregorian calendar date", jd));
    }

    auto Z = std::floor(jd + 0.5);
    auto secs = (jd + 0.5 - Z) * 86'400.;

    // NOTE: the fraction of the day can round up to a full day.
    if (secs >= 86'400.) {
        Z += 1;
        secs = 0;
    }

    const auto alpha = std::floor((Z - 1'867'216.25) / 36'524.25);
    const auto A = Z + 1 + alpha - std::floor(alpha / 4);
    const auto B = A + 1524;
    const auto C = std::floor((B - 122.1) / 365.25);
    const auto D = std::floor(365.25 * C);
    const auto E = std::floor((B - D) / 30.6001);

    calendar_date ret;
    ret.day = static_cast<int>(B - D - std::floor(30.6001 * E));
    ret.month = static_cast<int>(E < 14 ? E - 1 : E - 13);
    ret.year = static_cast<int>(ret.month > 2 ? C - 4716 : C - 4715);

    // Time of day.
    ret.hour = static_cast<int>(std::floor(secs / 3600));
    ret.minute = static_cast<int>(std::floor((secs - ret.hour * 3600.) / 60));
    ret.second = secs - ret.hour * 3600. - ret.minute * 60.;

    return ret;
}

} // namespace orbint
