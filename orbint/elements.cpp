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

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

#include <boost/math/constants/constants.hpp>

#include <fmt/core.h>

#include "elements.hpp"
#include "errors.hpp"
#include "kepler.hpp"
#include "trajectory.hpp"

namespace orbint
{

namespace detail
{

namespace
{

// Below this threshold, the eccentricity/node vectors are considered null
// (circular and/or equatorial orbits).
constexpr double degen_thresh = 1e-11;

using vec3_t = std::array<double, 3>;

double dot(const vec3_t &a, const vec3_t &b)
{
    return a[0] * b[0] + a[1] * b[1] + a[2] * b[2];
}

vec3_t cross(const vec3_t &a, const vec3_t &b)
{
    return {a[1] * b[2] - a[2] * b[1], a[2] * b[0] - a[0] * b[2], a[0] * b[1] - a[1] * b[0]};
}

void check_mu(double mu)
{
    if (!std::isfinite(mu) || mu <= 0) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The gravitational parameter must be finite and positive, but a value of {} was provided", mu));
    }
}

} // namespace

} // namespace detail

orbital_elements make_elements(double a, double e, double i, double node, double argp, double anomaly,
                               anomaly_kind kind, double epoch, angle_unit unit)
{
    const auto conv = (unit == angle_unit::degrees) ? boost::math::constants::degree<double>() : 1.;

    return orbital_elements{.a = a,
                            .e = e,
                            .i = i * conv,
                            .node = node * conv,
                            .argp = argp * conv,
                            .anomaly = anomaly * conv,
                            .kind = kind,
                            .epoch = epoch};
}

void check_elements(const orbital_elements &el)
{
#define ORBINT_ELEMENTS_CHECK_FINITE(data_member)                                                                      \
    if (!std::isfinite(el.data_member)) [[unlikely]] {                                                                 \
        throw invalid_elements(                                                                                        \
            fmt::format("Invalid orbital elements detected: the '{}' element is not finite", #data_member));           \
    }

    ORBINT_ELEMENTS_CHECK_FINITE(a)
    ORBINT_ELEMENTS_CHECK_FINITE(e)
    ORBINT_ELEMENTS_CHECK_FINITE(i)
    ORBINT_ELEMENTS_CHECK_FINITE(node)
    ORBINT_ELEMENTS_CHECK_FINITE(argp)
    ORBINT_ELEMENTS_CHECK_FINITE(anomaly)
    ORBINT_ELEMENTS_CHECK_FINITE(epoch)

#undef ORBINT_ELEMENTS_CHECK_FINITE

    if (el.a <= 0) [[unlikely]] {
        throw invalid_elements(fmt::format(
            "Invalid orbital elements detected: the semi-major axis must be positive, but it is {} instead", el.a));
    }

    if (el.e < 0 || el.e >= 1) [[unlikely]] {
        throw invalid_elements(fmt::format("Invalid orbital elements detected: the eccentricity must be in the [0, 1) "
                                           "range, but it is {} instead",
                                           el.e));
    }

    if (el.kind != anomaly_kind::mean_anomaly && el.kind != anomaly_kind::true_anomaly) [[unlikely]] {
        throw invalid_elements(fmt::format("Invalid orbital elements detected: unknown anomaly kind {}",
                                           static_cast<int>(el.kind)));
    }
}

orbital_elements normalise_elements(const orbital_elements &el)
{
    check_elements(el);

    auto ret = el;

    ret.i = wrap_angle(el.i);
    ret.node = wrap_angle(el.node);
    ret.argp = wrap_angle(el.argp);

    if (el.kind == anomaly_kind::true_anomaly) {
        ret.anomaly = true_to_mean_anomaly(el.anomaly, el.e);
        ret.kind = anomaly_kind::mean_anomaly;
    } else {
        ret.anomaly = wrap_angle(el.anomaly);
    }

    return ret;
}

double mean_motion(const orbital_elements &el, double mu)
{
    check_elements(el);
    detail::check_mu(mu);

    return std::sqrt(mu / (el.a * el.a * el.a));
}

double orbital_period(const orbital_elements &el, double mu)
{
    return boost::math::constants::two_pi<double>() / mean_motion(el, mu);
}

orbital_elements state_to_elements(const state_vector &sv, double mu)
{
    using detail::cross;
    using detail::degen_thresh;
    using detail::dot;
    using detail::vec3_t;

    detail::check_mu(mu);

    const auto &r = sv.r;
    const auto &v = sv.v;

    const auto r_mag = norm(r);
    const auto v2 = dot(v, v);

    if (!std::isfinite(r_mag) || !std::isfinite(v2) || r_mag == 0) [[unlikely]] {
        throw invalid_elements("Cannot compute the orbital elements of a state with a null or non-finite position "
                               "vector or a non-finite velocity vector");
    }

    // Angular momentum.
    const auto h = cross(r, v);
    const auto h_mag = norm(h);
    if (h_mag <= degen_thresh * r_mag * std::sqrt(v2)) [[unlikely]] {
        throw invalid_elements("Cannot compute the orbital elements of a rectilinear state");
    }
    const vec3_t h_hat{h[0] / h_mag, h[1] / h_mag, h[2] / h_mag};

    // Eccentricity vector.
    const auto rv = dot(r, v);
    vec3_t e_vec{};
    for (auto j = 0u; j < 3u; ++j) {
        e_vec[j] = ((v2 - mu / r_mag) * r[j] - rv * v[j]) / mu;
    }
    const auto e = norm(e_vec);

    // Semi-major axis from the energy.
    const auto energy = v2 / 2 - mu / r_mag;
    const auto a = -mu / (2 * energy);

    if (!(e < 1) || !(a > 0) || !std::isfinite(a)) [[unlikely]] {
        throw invalid_elements(fmt::format(
            "The state at time {} does not describe an elliptic orbit (eccentricity {}, semi-major axis {})", sv.t, e,
            a));
    }

    const auto inc = std::acos(std::clamp(h_hat[2], -1., 1.));

    // Node vector (z x h).
    const vec3_t n{-h[1], h[0], 0.};
    const auto n_mag = norm(n);
    const auto equatorial = n_mag <= degen_thresh * h_mag;
    const auto circular = e <= degen_thresh;

    // NOTE: for retrograde equatorial orbits, angles in the
    // reference plane are measured in the opposite direction.
    const auto sgn = (h_hat[2] < 0) ? -1. : 1.;

    double node = 0, argp = 0, nu = 0;

    if (!equatorial) {
        const vec3_t n_hat{n[0] / n_mag, n[1] / n_mag, 0.};
        node = std::atan2(n_hat[1], n_hat[0]);

        if (!circular) {
            argp = std::atan2(dot(h_hat, cross(n_hat, e_vec)), dot(n_hat, e_vec));
            nu = std::atan2(dot(h_hat, cross(e_vec, r)), dot(e_vec, r));
        } else {
            // Circular inclined: measure the anomaly from the node.
            nu = std::atan2(dot(h_hat, cross(n_hat, r)), dot(n_hat, r));
        }
    } else {
        if (!circular) {
            argp = std::atan2(sgn * e_vec[1], e_vec[0]);
            nu = std::atan2(dot(h_hat, cross(e_vec, r)), dot(e_vec, r));
        } else {
            // Circular equatorial: measure the anomaly from the x axis.
            nu = std::atan2(sgn * r[1], r[0]);
        }
    }

    return orbital_elements{.a = a,
                            .e = e,
                            .i = inc,
                            .node = wrap_angle(node),
                            .argp = wrap_angle(argp),
                            .anomaly = true_to_mean_anomaly(nu, e),
                            .kind = anomaly_kind::mean_anomaly,
                            .epoch = sv.t};
}

} // namespace orbint
