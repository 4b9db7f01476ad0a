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
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/lexical_cast.hpp>
#include <boost/math/constants/constants.hpp>

#include <fmt/core.h>

#include "elements.hpp"
#include "errors.hpp"
#include "julian.hpp"
#include "tle.hpp"

namespace orbint
{

namespace detail
{

namespace
{

constexpr std::size_t tle_line_length = 69;

std::string_view trim(std::string_view s)
{
    const auto b = s.find_first_not_of(' ');
    if (b == std::string_view::npos) {
        return {};
    }

    const auto e = s.find_last_not_of(' ');

    return s.substr(b, e - b + 1u);
}

// Parse the (1-based, inclusive) columns [first, last] of a TLE line.
template <typename T>
T parse_field(std::string_view line, std::size_t first, std::size_t last, const char *name)
{
    const auto field = trim(line.substr(first - 1u, last - first + 1u));

    try {
        return boost::lexical_cast<T>(std::string(field));
    } catch (const boost::bad_lexical_cast &) {
        throw std::invalid_argument(
            fmt::format("Unable to parse the TLE field '{}' from the string '{}'", name, std::string(field)));
    }
}

// Parse a number written in the TLE exponential notation with an
// implied leading decimal point (e.g., "-11606-4" = -0.11606e-4).
double parse_exp_field(std::string_view line, std::size_t first, const char *name)
{
    const auto field = line.substr(first - 1u, 8);

    const auto m_sign = (field[0] == '-') ? -1. : 1.;
    const auto e_sign = (field[6] == '-') ? -1 : 1;

    if ((field[6] != '-' && field[6] != '+' && field[6] != ' ')
        || (field[0] != '-' && field[0] != '+' && field[0] != ' ')) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Unable to parse the TLE field '{}' from the string '{}'", name, std::string(field)));
    }

    const auto mant = parse_field<double>(fmt::format("0.{}", field.substr(1, 5)), 1, 7, name);
    const auto exp = parse_field<int>(field, 8, 8, name);

    return m_sign * mant * std::pow(10., e_sign * exp);
}

void check_tle_line(std::string_view line, char number)
{
    if (line.size() != tle_line_length) [[unlikely]] {
        throw std::invalid_argument(fmt::format("TLE line {} must be {} characters long, but it is {} characters long",
                                                number, tle_line_length, line.size()));
    }

    if (line[0] != number || line[1] != ' ') [[unlikely]] {
        throw std::invalid_argument(fmt::format("The TLE line '{}' does not begin with the line number {}",
                                                std::string(line), number));
    }

    // Modulo-10 checksum: digits count their value, minus signs count 1.
    unsigned sum = 0;
    for (std::size_t i = 0; i + 1u < tle_line_length; ++i) {
        const auto c = line[i];

        if (c >= '0' && c <= '9') {
            sum += static_cast<unsigned>(c - '0');
        } else if (c == '-') {
            ++sum;
        }
    }

    const auto expected = line[tle_line_length - 1u];
    if (expected < '0' || expected > '9' || sum % 10u != static_cast<unsigned>(expected - '0')) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Checksum mismatch in TLE line {}: the computed checksum is {}, but "
                                                "the line reports '{}'",
                                                number, sum % 10u, expected));
    }
}

// UTC Julian date of January 1.0 of a Gregorian year.
} // namespace

} // namespace detail

gpe parse_tle(std::string_view line1, std::string_view line2)
{
    using detail::parse_field;

    detail::check_tle_line(line1, '1');
    detail::check_tle_line(line2, '2');

    const auto satnum1 = parse_field<std::uint64_t>(line1, 3, 7, "satellite number");
    const auto satnum2 = parse_field<std::uint64_t>(line2, 3, 7, "satellite number");

    if (satnum1 != satnum2) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The satellite numbers in the two lines of a TLE differ ({} vs {})", satnum1, satnum2));
    }

    gpe ret;
    ret.norad_id = satnum1;

    // Epoch.
    const auto yy = parse_field<int>(line1, 19, 20, "epoch year");
    const auto day = parse_field<double>(line1, 21, 32, "epoch day");
    if (yy < 0 || yy > 99 || !(day >= 1) || !(day < 367)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Invalid TLE epoch: year {}, day {}", yy, day));
    }
    // NOTE: two-digit years 57-99 refer to the 20th century.
    const auto year = (yy >= 57) ? 1900 + yy : 2000 + yy;
    ret.epoch_jd = calendar_to_jd(year, 1, 1) + (day - 1);

    ret.bstar = detail::parse_exp_field(line1, 54, "bstar");

    ret.i0 = parse_field<double>(line2, 9, 16, "inclination");
    ret.node0 = parse_field<double>(line2, 18, 25, "right ascension of the ascending node");
    // NOTE: the eccentricity has an implied leading decimal point.
    ret.e0 = parse_field<double>(fmt::format("0.{}", line2.substr(26, 7)), 1, 9, "eccentricity");
    ret.omega0 = parse_field<double>(line2, 35, 42, "argument of perigee");
    ret.m0 = parse_field<double>(line2, 44, 51, "mean anomaly");
    ret.n0 = parse_field<double>(line2, 53, 63, "mean motion");

    if (!(ret.n0 > 0)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Invalid TLE mean motion {}: it must be positive", ret.n0));
    }

    return ret;
}

orbital_elements gpe_to_elements(const gpe &g, double mu)
{
    if (!std::isfinite(mu) || mu <= 0) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The gravitational parameter must be finite and positive, but a value of {} was provided", mu));
    }

    if (!std::isfinite(g.n0) || g.n0 <= 0) [[unlikely]] {
        throw invalid_elements(fmt::format("The mean motion of the GPE of object {} must be finite and positive, "
                                           "but it is {} instead",
                                           g.norad_id, g.n0));
    }

    // Mean motion in rad/day.
    const auto n = g.n0 * boost::math::constants::two_pi<double>();

    auto ret = make_elements(std::cbrt(mu / (n * n)), g.e0, g.i0, g.node0, g.omega0, g.m0,
                             anomaly_kind::mean_anomaly, g.epoch_jd, angle_unit::degrees);
    check_elements(ret);

    return ret;
}

} // namespace orbint
