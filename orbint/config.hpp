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

#ifndef ORBINT_CONFIG_HPP
#define ORBINT_CONFIG_HPP

#include <map>
#include <string>
#include <vector>

#include "units.hpp"

namespace orbint
{

// A success score assigned to miss distances strictly below a threshold (AU).
struct score_tier {
    double max_miss_distance = 0;
    double score = 0;
};

// Constants of the mission model.
struct mission_config {
    // Gravitational parameter of the central body (AU**3/day**2).
    double mu = gm_sun_au3_day2;
    // Radius of the departure orbit (AU).
    double departure_radius = 1.;
    // Multiplicative margin on the Hohmann delta-v.
    double delta_v_margin = 1.5;
    // Miss distance below which an intercept is feasible (AU).
    double feasibility_threshold = 0.01;
    // Specific impulse (s) per propulsion tag.
    std::map<std::string, double> isp_table{{"chemical", 300.}, {"ion", 3000.}};
    // Tiers sorted by increasing threshold. The first tier whose threshold
    // exceeds the miss distance determines the score.
    std::vector<score_tier> score_tiers{{0.001, 0.95}, {0.01, 0.75}};
    // Score for miss distances beyond the last tier.
    double fallback_score = 0.3;
    // Standard gravity (m/s**2).
    double g0 = g0_m_s2;
};

// Throws std::invalid_argument if the config is not usable.
void check_config(const mission_config &);

namespace detail
{

// Default config with the overrides read from the environment.
[[nodiscard]] mission_config config_from_env();

} // namespace detail

[[nodiscard]] mission_config get_default_config();
void set_default_config(mission_config);

} // namespace orbint

#endif
