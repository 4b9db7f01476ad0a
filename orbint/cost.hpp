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

#ifndef ORBINT_COST_HPP
#define ORBINT_COST_HPP

#include <string>

#include "config.hpp"

namespace orbint
{

struct cost_estimate {
    // Delta-v including the configured margin (km/s).
    double delta_v = 0;
    // Hohmann transfer time (days).
    double flight_time = 0;
    // Fraction of the initial mass spent as propellant, in [0, 1).
    double fuel_fraction = 0;
    // Heuristic success score, in [0, 1].
    double success_score = 0;
};

// Specific impulse (s) of a propulsion type. Throws invalid_propulsion_type
// for tags missing from the configuration.
[[nodiscard]] double lookup_isp(const mission_config &, const std::string &);

// Tsiolkovsky propellant fraction for a delta-v in km/s, a specific
// impulse in s and the standard gravity in m/s**2.
[[nodiscard]] double rocket_fuel_fraction(double dv, double isp, double g0);

[[nodiscard]] double success_score(double miss_distance, const mission_config &);
[[nodiscard]] bool is_feasible(double miss_distance, const mission_config &);

// Cost of a Hohmann transfer from the departure orbit to a circular orbit of
// radius target_radius (AU), scored according to the miss distance (AU).
[[nodiscard]] cost_estimate estimate_cost(double target_radius, double miss_distance, const std::string &propulsion,
                                          const mission_config &);

} // namespace orbint

#endif
