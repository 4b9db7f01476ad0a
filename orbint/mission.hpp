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

#ifndef ORBINT_MISSION_HPP
#define ORBINT_MISSION_HPP

#include <string>

#include "config.hpp"
#include "cost.hpp"
#include "elements.hpp"
#include "intercept.hpp"
#include "trajectory.hpp"

namespace orbint
{

struct intercept_result {
    closest_approach approach;
    bool feasible = false;
    cost_estimate cost;
};

// Parameters of a fixed-epoch intercept plan.
struct intercept_plan_params {
    // Length of the interceptor arc preceding the intercept epoch (days).
    double mission_duration = 365;
    // Sampling step of the interceptor arc (days).
    double step = 1;
    // Maximum distance in time between the intercept epoch and
    // the nearest target sample (days).
    double max_epoch_gap = 1;
    std::string propulsion = "ion";
};

namespace detail
{

// Throws std::invalid_argument unless traj is in the heliocentric ecliptic
// frame (AU, AU/day), the only frame the cost model understands.
void check_heliocentric(const trajectory &traj, const char *name);

} // namespace detail

// Closest approach between the two trajectories, costed as a transfer
// to the heliocentric distance of the target at the approach. Both
// trajectories must be heliocentric.
[[nodiscard]] intercept_result evaluate_intercept(const trajectory &target, const trajectory &interceptor,
                                                  const std::string &propulsion, const mission_config &);

// Closest approach of the interceptor arc over [epoch - mission_duration, epoch]
// to the target sample nearest to epoch. The target index in the result refers
// to the full target trajectory, which must be heliocentric.
[[nodiscard]] intercept_result plan_intercept(const trajectory &target, const orbital_elements &interceptor,
                                              double epoch, const intercept_plan_params &, const mission_config &);

} // namespace orbint

#endif
