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

#include <cmath>

#include <boost/math/constants/constants.hpp>

#include <fmt/core.h>

#include "errors.hpp"
#include "kepler.hpp"

namespace orbint
{

double solve_kepler(double M, double e)
{
    if (!std::isfinite(M)) [[unlikely]] {
        throw invalid_elements(fmt::format("Cannot solve Kepler's equation with a non-finite mean anomaly {}", M));
    }

    if (!std::isfinite(e) || e < 0 || e >= 1) [[unlikely]] {
        throw invalid_elements(fmt::format(
            "Cannot solve Kepler's equation with an eccentricity of {}: the eccentricity must be in the [0, 1) range",
            e));
    }

    // NOTE: for high eccentricities, M is a poor initial guess.
    auto E = (e < 0.8) ? M : boost::math::constants::pi<double>();

    for (unsigned k = 0; k < kepler_max_iter; ++k) {
        const auto f = E - e * std::sin(E) - M;
        const auto fp = 1 - e * std::cos(E);

        if (std::abs(fp) < kepler_deriv_thresh) [[unlikely]] {
            // Accept the current iterate only if it already satisfies
            // the equation.
            if (std::abs(f) < kepler_tol) {
                return E;
            }

            throw numeric_divergence(
                fmt::format("Kepler's equation cannot be solved for M = {} and e = {}: the derivative of the "
                            "equation became singular at E = {} after {} iteration(s)",
                            M, e, E, k));
        }

        const auto E_new = E - f / fp;

        if (!std::isfinite(E_new)) [[unlikely]] {
            break;
        }

        if (std::abs(E_new - E) < kepler_tol) {
            return E_new;
        }

        E = E_new;
    }

    throw numeric_divergence(fmt::format("Kepler's equation did not converge for M = {} and e = {} within {} "
                                         "iterations (last iterate E = {})",
                                         M, e, kepler_max_iter, E));
}

double wrap_angle(double x)
{
    const auto twopi = boost::math::constants::two_pi<double>();

    auto ret = std::fmod(x, twopi);
    if (ret < 0) {
        ret += twopi;
    }

    // NOTE: fmod() of a tiny negative number plus 2pi can round to 2pi.
    if (ret >= twopi) {
        ret = 0;
    }

    return ret;
}

double ecc_to_true_anomaly(double E, double e)
{
    return 2 * std::atan2(std::sqrt(1 + e) * std::sin(E / 2), std::sqrt(1 - e) * std::cos(E / 2));
}

double true_to_ecc_anomaly(double nu, double e)
{
    return 2 * std::atan2(std::sqrt(1 - e) * std::sin(nu / 2), std::sqrt(1 + e) * std::cos(nu / 2));
}

double true_to_mean_anomaly(double nu, double e)
{
    const auto E = true_to_ecc_anomaly(nu, e);

    return wrap_angle(E - e * std::sin(E));
}

double mean_to_true_anomaly(double M, double e)
{
    return wrap_angle(ecc_to_true_anomaly(solve_kepler(wrap_angle(M), e), e));
}

} // namespace orbint
