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

#ifndef ORBINT_PROPAGATOR_HPP
#define ORBINT_PROPAGATOR_HPP

#include <cstddef>
#include <vector>

#include "elements.hpp"
#include "trajectory.hpp"
#include "units.hpp"

namespace orbint
{

// Uniform sampling of a time interval. All values are Julian dates/days.
struct time_grid {
    double begin = 0;
    double end = 0;
    double step = 1;
};

// Check the grid and return its sample times, begin + k*step for
// k = 0, ..., floor((end - begin) / step).
[[nodiscard]] std::vector<double> make_time_grid(const time_grid &);

// Number of samples in a grid.
[[nodiscard]] std::size_t grid_size(const time_grid &);

// Two-body state at time t of the object described by el.
[[nodiscard]] state_vector propagate_state(const orbital_elements &el, double t, double mu = gm_sun_au3_day2);

// Two-body trajectory sampled on a time grid.
[[nodiscard]] trajectory propagate(const orbital_elements &el, const time_grid &grid, double mu = gm_sun_au3_day2,
                                   frame_tag frame = frame_tag::heliocentric_ecliptic);

} // namespace orbint

#endif
