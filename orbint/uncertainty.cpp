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

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

#include <fmt/core.h>

#include "trajectory.hpp"
#include "uncertainty.hpp"
#include "units.hpp"

namespace orbint
{

namespace detail
{

namespace
{

void check_non_negative(double x, const char *name)
{
    if (!std::isfinite(x) || x < 0) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The {} must be finite and non-negative, but a value of {} was provided", name, x));
    }
}

void check_finite_point(const std::array<double, 3> &p, const char *name)
{
    if (!std::isfinite(p[0]) || !std::isfinite(p[1]) || !std::isfinite(p[2])) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The {} must consist of finite values, but it is [{}, {}, {}] instead", name, p[0], p[1], p[2]));
    }
}

} // namespace

} // namespace detail

double uncertainty_penalty(const std::array<double, 3> &chosen, const std::array<double, 3> &likely,
                           double time_to_intercept, double observation_arc)
{
    detail::check_finite_point(chosen, "chosen intercept point");
    detail::check_finite_point(likely, "most likely target position");
    detail::check_non_negative(time_to_intercept, "time to intercept");
    detail::check_non_negative(observation_arc, "observation arc");

    const auto dist_er = distance(chosen, likely) / earth_radius_km;

    const auto dist_term = std::min(0.3, dist_er / 100);
    const auto time_term = std::min(0.2, time_to_intercept / 1000);
    // NOTE: arcs of 180 days or longer carry no penalty.
    const auto arc_term = std::max(0., (180 - observation_arc) / 180 * 0.15);

    return std::min(max_uncertainty_penalty, dist_term + time_term + arc_term);
}

double penalised_success(double base, double penalty)
{
    if (!std::isfinite(base) || !std::isfinite(penalty)) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The base success score and the penalty must be finite, but the values {} and {} were provided", base,
            penalty));
    }

    return std::clamp(base - penalty, 0., 1.);
}

} // namespace orbint
