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

#ifndef ORBINT_ELEMENTS_HPP
#define ORBINT_ELEMENTS_HPP

#include <cstdint>

#include "trajectory.hpp"

namespace orbint
{

// Which anomaly is stored in an orbital_elements record.
enum class anomaly_kind : std::int32_t { mean_anomaly = 0, true_anomaly = 1 };

// Angular unit used at the boundary when building elements.
enum class angle_unit : std::int32_t { radians = 0, degrees = 1 };

// Classical orbital elements. Angles are in radians, the semi-major axis
// is in the length unit of the gravitational parameter used for propagation.
struct orbital_elements {
    // Semi-major axis.
    double a = 0;
    // Eccentricity.
    double e = 0;
    // Inclination.
    double i = 0;
    // Longitude of the ascending node.
    double node = 0;
    // Argument of periapsis.
    double argp = 0;
    // Mean or true anomaly at the reference epoch, depending on kind.
    double anomaly = 0;
    anomaly_kind kind = anomaly_kind::mean_anomaly;
    // Reference epoch (Julian date).
    double epoch = 0;
};

// Build an elements record, converting the angles from the given unit.
[[nodiscard]] orbital_elements make_elements(double a, double e, double i, double node, double argp, double anomaly,
                                             anomaly_kind kind, double epoch, angle_unit unit);

// Check that the elements describe a bound elliptic orbit. Throws invalid_elements otherwise.
void check_elements(const orbital_elements &);

// Return checked elements with all angles wrapped into [0, 2pi) and
// the anomaly expressed as a mean anomaly.
[[nodiscard]] orbital_elements normalise_elements(const orbital_elements &);

[[nodiscard]] double mean_motion(const orbital_elements &, double mu);
[[nodiscard]] double orbital_period(const orbital_elements &, double mu);

// Osculating elements of a Cartesian state. The returned elements carry the
// mean anomaly at the state's timestamp.
[[nodiscard]] orbital_elements state_to_elements(const state_vector &, double mu);

} // namespace orbint

#endif
