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

#ifndef ORBINT_UNCERTAINTY_HPP
#define ORBINT_UNCERTAINTY_HPP

#include <array>

namespace orbint
{

// Upper bound of the uncertainty penalty.
inline constexpr double max_uncertainty_penalty = 0.5;

// Penalty on the success score of an intercept aimed at a poorly known target.
//
// chosen and likely are the intercept point and the most likely target
// position (km). The penalty grows with their separation (measured in Earth
// radii), with the time to intercept (days) and with the shortness of the
// observation arc (days), and it is capped at max_uncertainty_penalty.
[[nodiscard]] double uncertainty_penalty(const std::array<double, 3> &chosen, const std::array<double, 3> &likely,
                                         double time_to_intercept, double observation_arc);

// Base success score reduced by a penalty, clamped to [0, 1].
[[nodiscard]] double penalised_success(double base, double penalty);

} // namespace orbint

#endif
