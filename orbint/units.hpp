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

#ifndef ORBINT_UNITS_HPP
#define ORBINT_UNITS_HPP

namespace orbint
{

// Astronomical unit in km.
inline constexpr double au_km = 149'597'870.7;

// Day in seconds.
inline constexpr double day_s = 86'400.;

// Gravitational parameters in km**3/s**2.
inline constexpr double gm_sun_km3_s2 = 1.32712440018e11;
inline constexpr double gm_earth_km3_s2 = 398'600.4418;

// Standard gravity in m/s**2.
inline constexpr double g0_m_s2 = 9.80665;

// Mean Earth radius in km.
inline constexpr double earth_radius_km = 6'371.;

// The gravitational parameters in the units used for
// propagation (length**3/day**2).
inline constexpr double gm_sun_au3_day2 = gm_sun_km3_s2 * day_s * day_s / (au_km * au_km * au_km);
inline constexpr double gm_earth_km3_day2 = gm_earth_km3_s2 * day_s * day_s;

// Julian date of the J2000 epoch.
inline constexpr double jd_j2000 = 2'451'545.;

[[nodiscard]] constexpr double au_to_km(double x) noexcept
{
    return x * au_km;
}

[[nodiscard]] constexpr double km_to_au(double x) noexcept
{
    return x / au_km;
}

[[nodiscard]] constexpr double au_per_day_to_km_per_s(double v) noexcept
{
    return v * au_km / day_s;
}

// Convert a gravitational parameter from AU**3/day**2 to km**3/s**2.
[[nodiscard]] constexpr double mu_au3_day2_to_km3_s2(double mu) noexcept
{
    return mu * au_km * au_km * au_km / (day_s * day_s);
}

} // namespace orbint

#endif
