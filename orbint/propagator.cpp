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

#include <array>
#include <cmath>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/numeric/conversion/cast.hpp>
#include <boost/safe_numerics/safe_integer.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

#include "elements.hpp"
#include "kepler.hpp"
#include "logging.hpp"
#include "propagator.hpp"
#include "trajectory.hpp"

namespace orbint
{

namespace detail
{

namespace
{

void check_time_grid(const time_grid &grid)
{
    if (!std::isfinite(grid.begin) || !std::isfinite(grid.end) || !std::isfinite(grid.step)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("A time grid must consist of finite values, but the grid [{}, {}] "
                                                "with a step of {} was provided",
                                                grid.begin, grid.end, grid.step));
    }

    if (!(grid.step > 0)) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The step of a time grid must be positive, but a value of {} was provided", grid.step));
    }

    if (grid.end < grid.begin) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "The end of a time grid ({}) cannot precede its beginning ({})", grid.end, grid.begin));
    }
}

// Precomputed quantities shared by all the samples of a propagation.
struct prop_data {
    double a, e, M0, epoch, n, h, sqrt_1pe, sqrt_1me;
    // First two columns of the perifocal-to-reference rotation.
    std::array<double, 3> P, Q;
};

prop_data make_prop_data(const orbital_elements &el_orig, double mu)
{
    if (!std::isfinite(mu) || mu <= 0) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The gravitational parameter must be finite and positive, but a value of {} was provided", mu));
    }

    // NOTE: this validates the elements and converts a true
    // anomaly into a mean anomaly at the epoch.
    const auto el = normalise_elements(el_orig);

    const auto cO = std::cos(el.node), sO = std::sin(el.node);
    const auto ci = std::cos(el.i), si = std::sin(el.i);
    const auto cw = std::cos(el.argp), sw = std::sin(el.argp);

    prop_data ret{};

    ret.a = el.a;
    ret.e = el.e;
    ret.M0 = el.anomaly;
    ret.epoch = el.epoch;
    ret.n = std::sqrt(mu / (el.a * el.a * el.a));
    ret.h = std::sqrt(mu * el.a * (1 - el.e * el.e));
    ret.sqrt_1pe = std::sqrt(1 + el.e);
    ret.sqrt_1me = std::sqrt(1 - el.e);

    // Rz(node) * Rx(i) * Rz(argp).
    ret.P = {cO * cw - sO * sw * ci, sO * cw + cO * sw * ci, sw * si};
    ret.Q = {-cO * sw - sO * cw * ci, -sO * sw + cO * cw * ci, cw * si};

    return ret;
}

state_vector eval_state(const prop_data &pd, double t, double mu)
{
    const auto M = wrap_angle(pd.M0 + pd.n * (t - pd.epoch));
    const auto E = solve_kepler(M, pd.e);

    const auto nu = 2 * std::atan2(pd.sqrt_1pe * std::sin(E / 2), pd.sqrt_1me * std::cos(E / 2));
    const auto cnu = std::cos(nu), snu = std::sin(nu);

    const auto r = pd.a * (1 - pd.e * std::cos(E));

    // Perifocal position.
    const auto xp = r * cnu, yp = r * snu;

    // Perifocal velocity from its radial and transverse components.
    const auto v_r = mu / pd.h * pd.e * snu;
    const auto v_t = pd.h / r;
    const auto vxp = v_r * cnu - v_t * snu, vyp = v_r * snu + v_t * cnu;

    state_vector ret;
    ret.t = t;
    ret.source = state_source::propagated;

    for (auto j = 0u; j < 3u; ++j) {
        ret.r[j] = pd.P[j] * xp + pd.Q[j] * yp;
        ret.v[j] = pd.P[j] * vxp + pd.Q[j] * vyp;
    }

    return ret;
}

} // namespace

} // namespace detail

std::size_t grid_size(const time_grid &grid)
{
    detail::check_time_grid(grid);

    // NOTE: a small relative slack so that an end point which is an exact
    // multiple of the step (up to roundoff) is included.
    const auto n_steps = std::floor((grid.end - grid.begin) / grid.step + 1e-9);

    return static_cast<std::size_t>(boost::safe_numerics::safe<std::size_t>(boost::numeric_cast<std::size_t>(n_steps))
                                    + 1);
}

std::vector<double> make_time_grid(const time_grid &grid)
{
    const auto n = grid_size(grid);

    std::vector<double> ret;
    ret.resize(boost::numeric_cast<decltype(ret.size())>(n));

    for (std::size_t k = 0; k < n; ++k) {
        ret[k] = grid.begin + static_cast<double>(k) * grid.step;
    }

    return ret;
}

state_vector propagate_state(const orbital_elements &el, double t, double mu)
{
    if (!std::isfinite(t)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Cannot propagate an orbit to the non-finite time {}", t));
    }

    return detail::eval_state(detail::make_prop_data(el, mu), t, mu);
}

trajectory propagate(const orbital_elements &el, const time_grid &grid, double mu, frame_tag frame)
{
    stopwatch sw;

    // NOTE: validate everything before doing any work.
    const auto pd = detail::make_prop_data(el, mu);
    const auto times = make_time_grid(grid);

    std::vector<state_vector> states;
    states.resize(boost::numeric_cast<decltype(states.size())>(times.size()));

    // NOTE: the samples are independent from each other.
    oneapi::tbb::parallel_for(oneapi::tbb::blocked_range<std::size_t>(0, times.size()),
                              [&pd, &times, &states, mu](const auto &range) {
                                  for (auto k = range.begin(); k != range.end(); ++k) {
                                      states[k] = detail::eval_state(pd, times[k], mu);
                                  }
                              });

    log_trace("propagate() computed {} states in {}s", states.size(), sw);

    return trajectory(std::move(states), frame);
}

} // namespace orbint
