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
#include <atomic>
#include <cstddef>
#include <limits>
#include <stdexcept>

#include <boost/safe_numerics/safe_integer.hpp>

#include <fmt/core.h>
#include <fmt/format.h>

#include <oneapi/tbb/blocked_range.h>
#include <oneapi/tbb/parallel_for.h>

#include "detail/atomic_minmax.hpp"
#include "errors.hpp"
#include "intercept.hpp"
#include "logging.hpp"
#include "trajectory.hpp"

namespace orbint
{

closest_approach find_closest_approach(const trajectory &target, const trajectory &interceptor)
{
    if (target.empty()) [[unlikely]] {
        throw insufficient_data("Cannot search for a closest approach: the target trajectory is empty");
    }

    if (interceptor.empty()) [[unlikely]] {
        throw insufficient_data("Cannot search for a closest approach: the interceptor trajectory is empty");
    }

    stopwatch sw;

    const auto &t_states = target.get_states();
    const auto &i_states = interceptor.get_states();

    const auto n_tgt = t_states.size();
    const auto n_int = i_states.size();

    // NOTE: pairs are identified in the second pass via the linear index
    // interceptor_idx * n_tgt + target_idx, so that the minimum linear index
    // realises the tie-breaking rule. Make sure it cannot overflow.
    const auto n_pairs = static_cast<std::size_t>(boost::safe_numerics::safe<std::size_t>(n_tgt) * n_int);

    // First pass: the global minimum distance.
    std::atomic<double> dmin(std::numeric_limits<double>::infinity());

    oneapi::tbb::parallel_for(oneapi::tbb::blocked_range<std::size_t>(0, n_int), [&](const auto &range) {
        auto local_min = std::numeric_limits<double>::infinity();

        for (auto i = range.begin(); i != range.end(); ++i) {
            for (const auto &ts : t_states) {
                local_min = std::min(local_min, distance(ts.r, i_states[i].r));
            }
        }

        detail::atomic_min(dmin, local_min);
    });

    const auto min_dist = dmin.load();
    const auto thresh = min_dist + approach_tie_rtol * std::max(1., min_dist);

    // Second pass: the earliest pair within tolerance of the minimum.
    std::atomic<std::size_t> best_idx(n_pairs);

    oneapi::tbb::parallel_for(oneapi::tbb::blocked_range<std::size_t>(0, n_int), [&](const auto &range) {
        for (auto i = range.begin(); i != range.end(); ++i) {
            for (std::size_t j = 0; j < n_tgt; ++j) {
                if (distance(t_states[j].r, i_states[i].r) <= thresh) {
                    detail::atomic_min(best_idx, i * n_tgt + j);

                    // NOTE: within a row, later target indices cannot improve.
                    break;
                }
            }
        }
    });

    const auto idx = best_idx.load();

    // LCOV_EXCL_START
    if (idx >= n_pairs) [[unlikely]] {
        throw std::logic_error(fmt::format(
            "Unable to locate the closest approach pair in trajectories of sizes {} and {}", n_tgt, n_int));
    }
    // LCOV_EXCL_STOP

    closest_approach ret;
    ret.interceptor_idx = idx / n_tgt;
    ret.target_idx = idx % n_tgt;
    ret.target = t_states[ret.target_idx];
    ret.interceptor = i_states[ret.interceptor_idx];
    ret.miss_distance = distance(ret.target.r, ret.interceptor.r);
    ret.relative_speed = distance(ret.target.v, ret.interceptor.v);

    log_trace("find_closest_approach() scanned {} pairs in {}s", n_pairs, sw);

    return ret;
}

} // namespace orbint
