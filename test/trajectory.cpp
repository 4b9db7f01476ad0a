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
#include <orbint/trajectory.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <stdexcept>
#include <vector>

namespace
{

std::vector<orbint::state_vector> make_states(const std::vector<double> &times)
{
    std::vector<orbint::state_vector> ret;
    for (const auto t : times) {
        ret.push_back(orbint::state_vector{.t = t, .r = {t, 2 * t, 0.}, .v = {1., 2., 0.}});
    }
    return ret;
}

} // namespace

TEST(Trajectory, FromSamples)
{
    const std::vector<orbint::trajectory::sample_t> samples{{0., 1., 2., 3., 4., 5., 6.},
                                                            {1., 7., 8., 9., 10., 11., 12.}};

    const orbint::trajectory traj(samples, orbint::frame_tag::geocentric_equatorial);

    ASSERT_EQ(traj.size(), 2u);
    EXPECT_EQ(traj.get_frame(), orbint::frame_tag::geocentric_equatorial);
    EXPECT_EQ(traj[1].t, 1.);
    EXPECT_EQ(traj[1].r[2], 9.);
    EXPECT_EQ(traj[1].v[0], 10.);
    EXPECT_EQ(traj[0].source, orbint::state_source::ephemeris);

    EXPECT_EQ(traj.to_samples(), samples);
}

TEST(Trajectory, Ordering)
{
    EXPECT_NO_THROW((void)orbint::trajectory(make_states({0., 1., 2.})));
    EXPECT_THROW((void)orbint::trajectory(make_states({0., 2., 1.})), std::invalid_argument);
    EXPECT_THROW((void)orbint::trajectory(make_states({0., 1., 1.})), std::invalid_argument);

    auto states = make_states({0., 1.});
    states[1].v[2] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_THROW((void)orbint::trajectory(states), std::invalid_argument);
}

TEST(Trajectory, EmptyAccess)
{
    const orbint::trajectory traj;

    EXPECT_TRUE(traj.empty());
    EXPECT_THROW((void)traj.front(), orbint::insufficient_data);
    EXPECT_THROW((void)traj.back(), orbint::insufficient_data);
    EXPECT_THROW((void)traj.nearest_index(0.), orbint::insufficient_data);
    EXPECT_THROW((void)traj[0], std::out_of_range);
}

TEST(Trajectory, NearestIndex)
{
    const orbint::trajectory traj(make_states({0., 1., 2., 3.}));

    EXPECT_EQ(traj.nearest_index(-5.), 0u);
    EXPECT_EQ(traj.nearest_index(0.), 0u);
    EXPECT_EQ(traj.nearest_index(1.4), 1u);
    // Ties go to the earlier state.
    EXPECT_EQ(traj.nearest_index(1.5), 1u);
    EXPECT_EQ(traj.nearest_index(1.6), 2u);
    EXPECT_EQ(traj.nearest_index(3.), 3u);
    EXPECT_EQ(traj.nearest_index(10.), 3u);

    EXPECT_THROW((void)traj.nearest_index(std::numeric_limits<double>::quiet_NaN()), std::invalid_argument);
}

TEST(Trajectory, Slice)
{
    const orbint::trajectory traj(make_states({0., 1., 2., 3.}), orbint::frame_tag::unspecified);

    const auto s1 = traj.slice(1., 2.);
    ASSERT_EQ(s1.size(), 2u);
    EXPECT_EQ(s1.front().t, 1.);
    EXPECT_EQ(s1.back().t, 2.);
    EXPECT_EQ(s1.get_frame(), orbint::frame_tag::unspecified);

    EXPECT_TRUE(traj.slice(1.2, 1.8).empty());
    EXPECT_EQ(traj.slice(-10., 10.).size(), 4u);

    EXPECT_THROW((void)traj.slice(2., 1.), std::invalid_argument);
}
