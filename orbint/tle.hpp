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

#ifndef ORBINT_TLE_HPP
#define ORBINT_TLE_HPP

#include <cstdint>
#include <string_view>

#include "elements.hpp"
#include "units.hpp"

namespace orbint
{

// Struct representing a GPE.
struct gpe {
    std::uint64_t norad_id = 0;
    // NOTE: UTC Julian date.
    double epoch_jd = 0;
    // Mean motion (revolutions per day).
    double n0 = 0;
    double e0 = 0;
    // Angles in degrees.
    double i0 = 0;
    double node0 = 0;
    double omega0 = 0;
    double m0 = 0;
    // Drag term (inverse Earth radii).
    double bstar = 0;
};

// Parse a two-line element set. Throws std::invalid_argument if the lines
// are malformed or their checksums do not match.
[[nodiscard]] gpe parse_tle(std::string_view line1, std::string_view line2);

// Keplerian elements corresponding to the mean elements of a GPE, with the semi-major
// axis derived from the mean motion. With the default gravitational parameter the
// semi-major axis is in km and the elements are meant to be propagated in km and days.
[[nodiscard]] orbital_elements gpe_to_elements(const gpe &, double mu = gm_earth_km3_day2);

} // namespace orbint

#endif
