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

#include <orbint/errors.hpp>
#include <orbint/intercept.hpp>
#include <orbint/trajectory.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <utility>
#include <vector>

namespace
{

orbint::trajectory line_trajectory(std::size_t n, const std::array<double, 3> &r0, const std::array<double, 3> &w)
{
    std::vector<orbint::state_vector> states;

    for (std::size_t k = 0; k < n; ++k) {
        const auto t = static_cast<double>(k);
        states.push_back(
            orbint::state_vector{.t = t, .r = {r0[0] + w[0] * t, r0[1] + w[1] * t, r0[2] + w[2] * t}, .v = w});
    }

    return orbint::trajectory(std::move(states));
}

orbint::trajectory point_trajectory(const std::vector<std::array<double, 3>> &pos)
{
    std::vector<orbint::state_vector> states;

    for (std::size_t k = 0; k < pos.size(); ++k) {
        states.push_back(orbint::state_vector{.t = static_cast<double>(k), .r = pos[k]});
    }

    return orbint::trajectory(std::move(states));
}

} // namespace

TEST(Intercept, SyntheticCrossing)
{
    // The target passes through (0, 1, 0) at t = 5, the interceptor at t = 6.
    const auto target = line_trajectory(11, {-5., 1., 0.}, {1., 0., 0.});
    const auto interceptor = line_trajectory(11, {0., -2., 0.}, {0., 0.5, 0.});

    const auto ca = orbint::find_closest_approach(target, interceptor);

    EXPECT_EQ(ca.target_idx, 5u);
    EXPECT_EQ(ca.interceptor_idx, 6u);
    EXPECT_EQ(ca.miss_distance, 0.);
    EXPECT_DOUBLE_EQ(ca.relative_speed, std::sqrt(1.25));
    EXPECT_EQ(ca.target.t, 5.);
    EXPECT_EQ(ca.interceptor.t, 6.);
}

TEST(Intercept, TieBreaking)
{
    // All the interceptor samples are equidistant from the target.
    const auto target = point_trajectory({{0., 0., 0.}});
    const auto interceptor = point_trajectory({{0., 0., 1.}, {-1., 0., 0.}, {0., 1., 0.}});

    auto ca = orbint::find_closest_approach(target, interceptor);
    EXPECT_EQ(ca.interceptor_idx, 0u);
    EXPECT_EQ(ca.target_idx, 0u);
    EXPECT_EQ(ca.miss_distance, 1.);

    // Same with the roles reversed.
    ca = orbint::find_closest_approach(interceptor, target);
    EXPECT_EQ(ca.interceptor_idx, 0u);
    EXPECT_EQ(ca.target_idx, 0u);

    // Distances within the tie tolerance of the minimum.
    const auto near_tie = point_trajectory({{1. + 1e-14, 0., 0.}, {1., 0., 0.}});
    ca = orbint::find_closest_approach(target, near_tie);
    EXPECT_EQ(ca.interceptor_idx, 0u);

    // Distances outside the tolerance.
    const auto no_tie = point_trajectory({{1. + 1e-9, 0., 0.}, {1., 0., 0.}});
    ca = orbint::find_closest_approach(target, no_tie);
    EXPECT_EQ(ca.interceptor_idx, 1u);
}

TEST(Intercept, MatchesSerialScan)
{
    std::vector<std::array<double, 3>> tpos, ipos;
    for (int k = 0; k < 200; ++k) {
        tpos.push_back({std::sin(0.37 * k), std::cos(0.11 * k), std::sin(0.05 * k + 1.)});
    }
    for (int k = 0; k < 300; ++k) {
        ipos.push_back({std::cos(0.23 * k), std::sin(0.13 * k + 0.5), std::cos(0.07 * k)});
    }

    const auto target = point_trajectory(tpos);
    const auto interceptor = point_trajectory(ipos);

    double dmin = std::numeric_limits<double>::infinity();
    for (const auto &ip : ipos) {
        for (const auto &tp : tpos) {
            dmin = std::min(dmin, orbint::distance(tp, ip));
        }
    }

    const auto ca = orbint::find_closest_approach(target, interceptor);

    EXPECT_GE(ca.miss_distance, dmin);
    EXPECT_LE(ca.miss_distance, dmin + orbint::approach_tie_rtol * std::max(1., dmin));
    EXPECT_EQ(orbint::distance(tpos[ca.target_idx], ipos[ca.interceptor_idx]), ca.miss_distance);
}

TEST(Intercept, EmptyTrajectories)
{
    const auto traj = point_trajectory({{1., 0., 0.}});
    const orbint::trajectory empty;

    EXPECT_THROW((void)orbint::find_closest_approach(empty, traj), orbint::insufficient_data);
    EXPECT_THROW((void)orbint::find_closest_approach(traj, empty), orbint::insufficient_data);
    EXPECT_THROW((void)orbint::find_closest_approach(empty, empty), orbint::insufficient_data);
}
