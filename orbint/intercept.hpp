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

#ifndef ORBINT_INTERCEPT_HPP
#define ORBINT_INTERCEPT_HPP

#include <cstddef>

#include "trajectory.hpp"

namespace orbint
{

// Geometry of the closest approach between two sampled trajectories.
struct closest_approach {
    // Indices of the samples realising the minimum distance.
    std::size_t target_idx = 0;
    std::size_t interceptor_idx = 0;
    state_vector target;
    state_vector interceptor;
    // Euclidean distance between the two positions.
    double miss_distance = 0;
    // Norm of the velocity difference.
    double relative_speed = 0;
};

// Relative tolerance used to detect ties in the miss distance.
inline constexpr double approach_tie_rtol = 1e-12;

// Exhaustive search for the pair of samples (one per trajectory) with the
// smallest mutual distance. Pairs are compared regardless of their timestamps.
// Ties are resolved in favour of the smallest interceptor index, then of the
// smallest target index. Throws insufficient_data if either trajectory is empty.
[[nodiscard]] closest_approach find_closest_approach(const trajectory &target, const trajectory &interceptor);

} // namespace orbint

#endif
