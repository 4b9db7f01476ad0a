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
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "config.hpp"
#include "cost.hpp"
#include "errors.hpp"
#include "intercept.hpp"
#include "logging.hpp"
#include "mission.hpp"
#include "propagator.hpp"
#include "trajectory.hpp"

namespace orbint
{

namespace detail
{

namespace
{

intercept_result cost_approach(closest_approach ca, const std::string &propulsion, const mission_config &cfg)
{
    intercept_result ret;

    ret.cost = estimate_cost(norm(ca.target.r), ca.miss_distance, propulsion, cfg);
    ret.feasible = is_feasible(ca.miss_distance, cfg);
    ret.approach = std::move(ca);

    return ret;
}

} // namespace

void check_heliocentric(const trajectory &traj, const char *name)
{
    if (traj.get_frame() != frame_tag::heliocentric_ecliptic) [[unlikely]] {
        throw std::invalid_argument(fmt::format("The {} trajectory must be in the heliocentric ecliptic frame in order "
                                                "to be costed, but the frame {} was provided instead",
                                                name, static_cast<std::int32_t>(traj.get_frame())));
    }
}

} // namespace detail

intercept_result evaluate_intercept(const trajectory &target, const trajectory &interceptor,
                                    const std::string &propulsion, const mission_config &cfg)
{
    // NOTE: fail early on bad setups, before the search.
    check_config(cfg);
    static_cast<void>(lookup_isp(cfg, propulsion));
    detail::check_heliocentric(target, "target");
    detail::check_heliocentric(interceptor, "interceptor");

    return detail::cost_approach(find_closest_approach(target, interceptor), propulsion, cfg);
}

intercept_result plan_intercept(const trajectory &target, const orbital_elements &interceptor, double epoch,
                                const intercept_plan_params &params, const mission_config &cfg)
{
    check_config(cfg);
    static_cast<void>(lookup_isp(cfg, params.propulsion));

    if (!std::isfinite(epoch)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("The intercept epoch must be finite, but it is {} instead", epoch));
    }

    if (!std::isfinite(params.mission_duration) || params.mission_duration <= 0) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The mission duration must be finite and positive, but it is {} instead", params.mission_duration));
    }

    if (!std::isfinite(params.max_epoch_gap) || params.max_epoch_gap < 0) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The maximum epoch gap must be finite and non-negative, but it is {} instead", params.max_epoch_gap));
    }

    if (target.empty()) [[unlikely]] {
        throw insufficient_data("Cannot plan an intercept: the target trajectory is empty");
    }

    detail::check_heliocentric(target, "target");

    const auto tgt_idx = target.nearest_index(epoch);
    const auto &tgt_state = target[tgt_idx];

    if (std::abs(tgt_state.t - epoch) > params.max_epoch_gap) [[unlikely]] {
        throw insufficient_data(
            fmt::format("Cannot plan an intercept at the epoch {}: the nearest target state is at {}, which is more "
                        "than {} day(s) away",
                        epoch, tgt_state.t, params.max_epoch_gap));
    }

    const auto arc = propagate(interceptor,
                               time_grid{.begin = epoch - params.mission_duration, .end = epoch, .step = params.step},
                               cfg.mu, target.get_frame());

    auto ca = find_closest_approach(trajectory(std::vector{tgt_state}, target.get_frame()), arc);
    ca.target_idx = tgt_idx;

    log_debug("plan_intercept(): miss distance of {} at the interceptor sample {} (t = {})", ca.miss_distance,
              ca.interceptor_idx, ca.interceptor.t);

    return detail::cost_approach(std::move(ca), params.propulsion, cfg);
}

} // namespace orbint
