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

#include <orbint/units.hpp>

#include <gtest/gtest.h>

#include <cmath>

TEST(Units, Constants)
{
    // The square of the Gaussian gravitational constant.
    EXPECT_LT(std::abs(orbint::gm_sun_au3_day2 / (0.01720209895 * 0.01720209895) - 1), 1e-9);

    EXPECT_LT(std::abs(orbint::mu_au3_day2_to_km3_s2(orbint::gm_sun_au3_day2) / orbint::gm_sun_km3_s2 - 1), 1e-14);
}

TEST(Units, Conversions)
{
    EXPECT_EQ(orbint::au_to_km(1.), orbint::au_km);
    EXPECT_LT(std::abs(orbint::km_to_au(orbint::au_to_km(1.5)) - 1.5), 1e-15);

    // 1 AU/day is about 1731.46 km/s.
    EXPECT_LT(std::abs(orbint::au_per_day_to_km_per_s(1.) - orbint::au_km / orbint::day_s), 1e-9);
    EXPECT_LT(std::abs(orbint::au_per_day_to_km_per_s(1.) - 1731.456836805556), 1e-9);
}
