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

#include <orbint/uncertainty.hpp>
#include <orbint/units.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace
{

inline bool near_abs(const double a, const double b, const double abs_tol) { return std::abs(a - b) <= abs_tol; }

const std::array<double, 3> origin{};

} // namespace

TEST(Uncertainty, Penalty)
{
    const std::array<double, 3> p1{1e8, 2e7, -3e6};

    // Well-determined orbit, immediate intercept.
    EXPECT_EQ(orbint::uncertainty_penalty(p1, p1, 0., 180.), 0.);
    EXPECT_EQ(orbint::uncertainty_penalty(p1, p1, 0., 400.), 0.);

    // Ten Earth radii between the chosen and the most likely position, 100 days
    // to the intercept and a 90-day observation arc.
    const std::array<double, 3> a{1e8, 0., 0.}, b{1e8 + 10 * orbint::earth_radius_km, 0., 0.};
    const auto p = orbint::uncertainty_penalty(a, b, 100., 90.);
    EXPECT_TRUE(near_abs(p, 0.1 + 0.1 + 0.075, 1e-12));

    // The distance term is symmetric.
    EXPECT_EQ(orbint::uncertainty_penalty(b, a, 100., 90.), p);

    // Shortest observation arc.
    EXPECT_TRUE(near_abs(orbint::uncertainty_penalty(origin, origin, 0., 0.), 0.15, 1e-15));
}

TEST(Uncertainty, SeparationIn3D)
{
    // Same heliocentric distance, opposite sides of the Sun.
    const std::array<double, 3> a{1e6, 0., 0.}, b{-1e6, 0., 0.};
    EXPECT_TRUE(near_abs(orbint::uncertainty_penalty(a, b, 0., 180.), 0.3, 1e-15));

    // Ten Earth radii along a direction orthogonal to the position.
    const std::array<double, 3> c{1e8, 0., 0.}, d{1e8, 6 * orbint::earth_radius_km, 8 * orbint::earth_radius_km};
    EXPECT_TRUE(near_abs(orbint::uncertainty_penalty(c, d, 0., 180.), 0.1, 1e-12));
}

TEST(Uncertainty, Caps)
{
    const std::array<double, 3> far{0., 0., 1e9};

    // Distance term capped at 0.3.
    EXPECT_TRUE(near_abs(orbint::uncertainty_penalty(origin, far, 0., 180.), 0.3, 1e-15));

    // Time term capped at 0.2.
    EXPECT_TRUE(near_abs(orbint::uncertainty_penalty(origin, origin, 1e5, 180.), 0.2, 1e-15));

    // Overall cap.
    EXPECT_EQ(orbint::uncertainty_penalty(origin, far, 1e5, 0.), orbint::max_uncertainty_penalty);
    EXPECT_EQ(orbint::uncertainty_penalty(origin, far, 1e5, 180.), orbint::max_uncertainty_penalty);
}

TEST(Uncertainty, PenalisedSuccess)
{
    EXPECT_TRUE(near_abs(orbint::penalised_success(0.95, 0.275), 0.675, 1e-14));
    EXPECT_EQ(orbint::penalised_success(0.3, 0.5), 0.);
    EXPECT_EQ(orbint::penalised_success(0.75, 0.), 0.75);

    EXPECT_THROW((void)orbint::penalised_success(std::numeric_limits<double>::quiet_NaN(), 0.),
                 std::invalid_argument);
}

TEST(Uncertainty, InvalidInput)
{
    const std::array<double, 3> bad{0., std::numeric_limits<double>::quiet_NaN(), 0.};

    EXPECT_THROW((void)orbint::uncertainty_penalty(bad, origin, 0., 0.), std::invalid_argument);
    EXPECT_THROW((void)orbint::uncertainty_penalty(origin, bad, 0., 0.), std::invalid_argument);
    EXPECT_THROW((void)orbint::uncertainty_penalty(origin, origin, -1., 0.), std::invalid_argument);
    EXPECT_THROW((void)orbint::uncertainty_penalty(origin, origin, 0., -1.), std::invalid_argument);
    EXPECT_THROW((void)orbint::uncertainty_penalty(origin, origin, std::numeric_limits<double>::infinity(), 0.),
                 std::invalid_argument);
}
