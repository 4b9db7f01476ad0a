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

#ifndef ORBINT_LAUNCH_WINDOWS_HPP
#define ORBINT_LAUNCH_WINDOWS_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "cost.hpp"
#include "elements.hpp"
#include "trajectory.hpp"

namespace orbint
{

struct launch_window {
    double departure_time = 0;
    // Time of the interceptor sample at the closest approach.
    double intercept_time = 0;
    bool feasible = false;
    double miss_distance = 0;
    double relative_speed = 0;
    cost_estimate cost;
};

struct window_scan_params {
    // Length of the interceptor arc after each departure (days).
    double max_duration = 365;
    // Spacing between candidate departures (days).
    double stride = 30;
    // Sampling step of the interceptor arcs (days).
    double step = 1;
    std::string propulsion = "ion";
    // Report only the feasible windows.
    bool feasible_only = true;
};

// Evaluate the departures t_first + k*stride (such that the whole arc fits within the
// target trajectory). For each departure, the interceptor elements are re-referenced so
// that their anomaly describes the spacecraft at departure. The windows are returned in
// departure order.
[[nodiscard]] std::vector<launch_window> scan_launch_windows(const trajectory &target,
                                                             const orbital_elements &interceptor,
                                                             const window_scan_params &, const mission_config &);

} // namespace orbint

#endif
