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

#ifndef ORBINT_KEPLER_HPP
#define ORBINT_KEPLER_HPP

namespace orbint
{

// Absolute tolerance on the eccentric anomaly increment.
inline constexpr double kepler_tol = 1e-8;

// Maximum number of Newton iterations.
inline constexpr unsigned kepler_max_iter = 20;

// Threshold below which the derivative of Kepler's
// equation is considered singular.
inline constexpr double kepler_deriv_thresh = 1e-12;

// Solve Kepler's equation M = E - e*sin(E) for the eccentric anomaly E.
//
// Newton-Raphson iteration starting from E0 = M (e < 0.8) or E0 = pi (e >= 0.8).
// Throws invalid_elements if e is not in [0, 1) or if M is not finite, and
// numeric_divergence if the iteration does not converge.
[[nodiscard]] double solve_kepler(double M, double e);

// Wrap an angle into the [0, 2pi) range.
[[nodiscard]] double wrap_angle(double);

// Anomaly conversions for elliptic orbits. All angles in radians.
[[nodiscard]] double ecc_to_true_anomaly(double E, double e);
[[nodiscard]] double true_to_ecc_anomaly(double nu, double e);
[[nodiscard]] double true_to_mean_anomaly(double nu, double e);
[[nodiscard]] double mean_to_true_anomaly(double M, double e);

} // namespace orbint

#endif
