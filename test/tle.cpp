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

#include <orbint/elements.hpp>
#include <orbint/errors.hpp>
#include <orbint/julian.hpp>
#include <orbint/tle.hpp>

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include <boost/math/constants/constants.hpp>

namespace
{

inline bool near_rel(const double a, const double b, const double rel_tol, const double abs_floor = 0.0)
{
    const double scale = std::max(abs_floor, std::max(std::abs(a), std::abs(b)));
    return std::abs(a - b) <= rel_tol * scale;
}

const std::string iss_line1 = "1 25544U 98067A   08264.51782528 -.00002182  00000-0 -11606-4 0  2927";
const std::string iss_line2 = "2 25544  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563537";

} // namespace

TEST(Tle, ParseIss)
{
    const auto g = orbint::parse_tle(iss_line1, iss_line2);

    EXPECT_EQ(g.norad_id, 25544u);
    EXPECT_TRUE(near_rel(g.epoch_jd, 2454730.01782528, 1e-15));
    EXPECT_TRUE(near_rel(g.n0, 15.72125391, 1e-15));
    EXPECT_TRUE(near_rel(g.e0, 0.0006703, 1e-15));
    EXPECT_TRUE(near_rel(g.i0, 51.6416, 1e-15));
    EXPECT_TRUE(near_rel(g.node0, 247.4627, 1e-15));
    EXPECT_TRUE(near_rel(g.omega0, 130.536, 1e-15));
    EXPECT_TRUE(near_rel(g.m0, 325.0288, 1e-15));
    EXPECT_TRUE(near_rel(g.bstar, -1.1606e-5, 1e-14));
}

TEST(Tle, TwentiethCenturyEpoch)
{
    // Two-digit years from 57 onwards refer to the 1900s.
    const auto g = orbint::parse_tle("1 25544U 98067A   98264.51782528 -.00002182  00000-0 -11606-4 0  2926",
                                     iss_line2);

    EXPECT_TRUE(near_rel(g.epoch_jd, 2451078.01782528, 1e-15));
    EXPECT_TRUE(near_rel(g.epoch_jd, orbint::calendar_to_jd(1998, 1, 1) + 263.51782528, 1e-15));
}

TEST(Tle, Malformed)
{
    // Wrong checksum.
    auto bad = iss_line2;
    bad.back() = '8';
    EXPECT_THROW((void)orbint::parse_tle(iss_line1, bad), std::invalid_argument);

    // Wrong length.
    EXPECT_THROW((void)orbint::parse_tle(iss_line1.substr(0, 60), iss_line2), std::invalid_argument);
    EXPECT_THROW((void)orbint::parse_tle(iss_line1, iss_line2 + " "), std::invalid_argument);

    // Lines swapped.
    EXPECT_THROW((void)orbint::parse_tle(iss_line2, iss_line1), std::invalid_argument);

    // Different satellite numbers in the two lines.
    EXPECT_THROW((void)orbint::parse_tle(iss_line1,
                                         "2 25545  51.6416 247.4627 0006703 130.5360 325.0288 15.72125391563538"),
                 std::invalid_argument);
}

TEST(Tle, ToElements)
{
    const auto g = orbint::parse_tle(iss_line1, iss_line2);
    const auto el = orbint::gpe_to_elements(g);

    const double deg = boost::math::constants::degree<double>();

    EXPECT_TRUE(near_rel(el.a, 6730.960676936836, 1e-12));
    EXPECT_EQ(el.e, g.e0);
    EXPECT_TRUE(near_rel(el.i, 51.6416 * deg, 1e-15));
    EXPECT_TRUE(near_rel(el.node, 247.4627 * deg, 1e-15));
    EXPECT_TRUE(near_rel(el.argp, 130.536 * deg, 1e-15));
    EXPECT_TRUE(near_rel(el.anomaly, 325.0288 * deg, 1e-15));
    EXPECT_EQ(el.kind, orbint::anomaly_kind::mean_anomaly);
    EXPECT_EQ(el.epoch, g.epoch_jd);

    auto g2 = g;
    g2.n0 = 0;
    EXPECT_THROW((void)orbint::gpe_to_elements(g2), orbint::invalid_elements);

    g2 = g;
    g2.e0 = 1.2;
    EXPECT_THROW((void)orbint::gpe_to_elements(g2), orbint::invalid_elements);

    EXPECT_THROW((void)orbint::gpe_to_elements(g, -1.), std::invalid_argument);
}
