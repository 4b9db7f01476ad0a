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
#include <string>

#include <boost/math/constants/constants.hpp>

#include <fmt/core.h>

#include "config.hpp"
#include "cost.hpp"
#include "errors.hpp"
#include "units.hpp"

namespace orbint
{

namespace detail
{

namespace
{

void check_miss_distance(double miss_distance)
{
    if (!std::isfinite(miss_distance) || miss_distance < 0) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The miss distance must be finite and non-negative, but a value of {} was provided", miss_distance));
    }
}

} // namespace

} // namespace detail

double lookup_isp(const mission_config &cfg, const std::string &tag)
{
    const auto it = cfg.isp_table.find(tag);

    if (it == cfg.isp_table.end()) [[unlikely]] {
        std::string known;
        for (const auto &p : cfg.isp_table) {
            known += fmt::format("{}'{}'", known.empty() ? "" : ", ", p.first);
        }

        throw invalid_propulsion_type(
            fmt::format("Unknown propulsion type '{}' (the known types are: {})", tag, known));
    }

    return it->second;
}

double rocket_fuel_fraction(double dv, double isp, double g0)
{
    if (!std::isfinite(dv) || dv < 0) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The delta-v must be finite and non-negative, but a value of {} was provided", dv));
    }

    if (!std::isfinite(isp) || isp <= 0 || !std::isfinite(g0) || g0 <= 0) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The specific impulse and the standard gravity must be finite and positive, but the values {} and {} "
            "were provided",
            isp, g0));
    }

    // Exhaust velocity in km/s.
    const auto ve = isp * g0 / 1000.;

    // NOTE: 1 - 1/mass_ratio, written to avoid cancellation.
    return -std::expm1(-dv / ve);
}

double success_score(double miss_distance, const mission_config &cfg)
{
    detail::check_miss_distance(miss_distance);

    for (const auto &tier : cfg.score_tiers) {
        if (miss_distance < tier.max_miss_distance) {
            return tier.score;
        }
    }

    return cfg.fallback_score;
}

bool is_feasible(double miss_distance, const mission_config &cfg)
{
    detail::check_miss_distance(miss_distance);

    return miss_distance < cfg.feasibility_threshold;
}

cost_estimate estimate_cost(double target_radius, double miss_distance, const std::string &propulsion,
                            const mission_config &cfg)
{
    check_config(cfg);

    if (!std::isfinite(target_radius) || target_radius <= 0) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The target radius must be finite and positive, but a value of {} was provided", target_radius));
    }

    const auto isp = lookup_isp(cfg, propulsion);

    const auto mu = mu_au3_day2_to_km3_s2(cfg.mu);
    const auto r1 = au_to_km(cfg.departure_radius);
    const auto r2 = au_to_km(target_radius);

    // Hohmann transfer from the circular departure orbit.
    const auto v_circ = std::sqrt(mu / r1);
    const auto a_transfer = (r1 + r2) / 2;
    const auto v_transfer = std::sqrt(mu * (2 / r1 - 1 / a_transfer));

    cost_estimate ret;
    ret.delta_v = std::abs(v_transfer - v_circ) * cfg.delta_v_margin;
    ret.flight_time
        = boost::math::constants::pi<double>() * std::sqrt(a_transfer * a_transfer * a_transfer / mu) / day_s;
    ret.fuel_fraction = rocket_fuel_fraction(ret.delta_v, isp, cfg.g0);
    ret.success_score = success_score(miss_distance, cfg);

    return ret;
}

} // namespace orbint
