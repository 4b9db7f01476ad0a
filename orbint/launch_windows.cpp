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
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <vector>

#include <boost/numeric/conversion/cast.hpp>
#include <boost/safe_numerics/safe_integer.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

#include "config.hpp"
#include "cost.hpp"
#include "elements.hpp"
#include "errors.hpp"
#include "intercept.hpp"
#include "launch_windows.hpp"
#include "logging.hpp"
#include "mission.hpp"
#include "propagator.hpp"
#include "trajectory.hpp"

namespace orbint
{

namespace detail
{

namespace
{

void check_scan_params(const window_scan_params &params)
{
#define ORBINT_SCAN_CHECK_POSITIVE(data_member)                                                                        \
    if (!std::isfinite(params.data_member) || params.data_member <= 0) [[unlikely]] {                                  \
        throw std::invalid_argument(fmt::format("The '{}' parameter of a launch window scan must be finite and "       \
                                                "positive, but it is {} instead",                                      \
                                                #data_member, params.data_member));                                    \
    }

    ORBINT_SCAN_CHECK_POSITIVE(max_duration)
    ORBINT_SCAN_CHECK_POSITIVE(stride)
    ORBINT_SCAN_CHECK_POSITIVE(step)

#undef ORBINT_SCAN_CHECK_POSITIVE
}

// Number of candidate departures.
std::size_t n_departures(double t_first, double t_last, const window_scan_params &params)
{
    const auto span = t_last - t_first - params.max_duration;

    if (span < 0) {
        return 0;
    }

    return static_cast<std::size_t>(
        boost::safe_numerics::safe<std::size_t>(boost::numeric_cast<std::size_t>(std::floor(span / params.stride + 1e-9)))
        + 1);
}

std::optional<launch_window> eval_departure(const trajectory &target, const orbital_elements &interceptor, double t_d,
                                            const window_scan_params &params, const mission_config &cfg)
{
    const auto t_end = t_d + params.max_duration;

    const auto tgt_arc = target.slice(t_d, t_end);
    if (tgt_arc.empty()) {
        log_debug("scan_launch_windows(): no target states in the interval [{}, {}], skipping the departure", t_d,
                  t_end);

        return {};
    }

    auto el = interceptor;
    el.epoch = t_d;

    const auto int_arc
        = propagate(el, time_grid{.begin = t_d, .end = t_end, .step = params.step}, cfg.mu, target.get_frame());

    const auto ca = find_closest_approach(tgt_arc, int_arc);

    launch_window ret;
    ret.departure_time = t_d;
    ret.intercept_time = ca.interceptor.t;
    ret.feasible = is_feasible(ca.miss_distance, cfg);
    ret.miss_distance = ca.miss_distance;
    ret.relative_speed = ca.relative_speed;
    ret.cost = estimate_cost(norm(ca.target.r), ca.miss_distance, params.propulsion, cfg);

    return ret;
}

} // namespace

} // namespace detail

std::vector<launch_window> scan_launch_windows(const trajectory &target, const orbital_elements &interceptor,
                                               const window_scan_params &params, const mission_config &cfg)
{
    stopwatch sw;

    if (target.empty()) [[unlikely]] {
        throw insufficient_data("Cannot scan for launch windows: the target trajectory is empty");
    }

    detail::check_heliocentric(target, "target");
    detail::check_scan_params(params);
    check_config(cfg);
    check_elements(interceptor);
    static_cast<void>(lookup_isp(cfg, params.propulsion));

    const auto t_first = target.front().t;
    const auto t_last = target.back().t;

    const auto n_cand = detail::n_departures(t_first, t_last, params);
    if (n_cand == 0u) {
        log_warning("scan_launch_windows(): the target trajectory spans {} day(s), which is shorter than the maximum "
                    "mission duration of {} day(s)",
                    t_last - t_first, params.max_duration);
    }

    std::vector<std::optional<launch_window>> cands;
    cands.resize(boost::numeric_cast<decltype(cands.size())>(n_cand));

    oneapi::tbb::parallel_for(oneapi::tbb::blocked_range<std::size_t>(0, n_cand), [&](const auto &range) {
        for (auto k = range.begin(); k != range.end(); ++k) {
            const auto t_d = t_first + static_cast<double>(k) * params.stride;
            cands[k] = detail::eval_departure(target, interceptor, t_d, params, cfg);
        }
    });

    std::vector<launch_window> ret;
    std::size_t n_feasible = 0;

    for (const auto &c : cands) {
        if (!c) {
            continue;
        }

        n_feasible += c->feasible;

        if (c->feasible || !params.feasible_only) {
            ret.push_back(*c);
        }
    }

    log_info("Launch window scan: {} candidate departure(s), {} feasible, {} reported in {}s", n_cand, n_feasible,
             ret.size(), sw);

    return ret;
}

} // namespace orbint
