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

#include <orbint/config.hpp>
#include <orbint/units.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <stdexcept>

TEST(Config, Defaults)
{
    const orbint::mission_config cfg;

    EXPECT_EQ(cfg.mu, orbint::gm_sun_au3_day2);
    EXPECT_EQ(cfg.departure_radius, 1.);
    EXPECT_EQ(cfg.delta_v_margin, 1.5);
    EXPECT_EQ(cfg.feasibility_threshold, 0.01);
    EXPECT_EQ(cfg.isp_table.at("ion"), 3000.);
    EXPECT_EQ(cfg.isp_table.at("chemical"), 300.);
    ASSERT_EQ(cfg.score_tiers.size(), 2u);
    EXPECT_EQ(cfg.fallback_score, 0.3);
    EXPECT_EQ(cfg.g0, 9.80665);

    EXPECT_NO_THROW(orbint::check_config(cfg));
}

TEST(Config, Validation)
{
    {
        orbint::mission_config cfg;
        cfg.feasibility_threshold = 0;
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        orbint::mission_config cfg;
        cfg.delta_v_margin = -1.;
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        orbint::mission_config cfg;
        cfg.isp_table.clear();
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        orbint::mission_config cfg;
        cfg.isp_table["broken"] = 0.;
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        // Thresholds not increasing.
        orbint::mission_config cfg;
        cfg.score_tiers = {{0.01, 0.95}, {0.001, 0.75}};
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        // Scores increasing with the miss distance.
        orbint::mission_config cfg;
        cfg.score_tiers = {{0.001, 0.5}, {0.01, 0.75}};
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        orbint::mission_config cfg;
        cfg.fallback_score = 0.8;
        EXPECT_THROW(orbint::check_config(cfg), std::invalid_argument);
    }

    {
        // No tiers at all is fine.
        orbint::mission_config cfg;
        cfg.score_tiers.clear();
        EXPECT_NO_THROW(orbint::check_config(cfg));
    }
}

TEST(Config, Environment)
{
    ::setenv("ORBINT_FEASIBILITY_THRESHOLD", "0.02", 1);
    ::setenv("ORBINT_DELTA_V_MARGIN", "2", 1);
    ::unsetenv("ORBINT_DEPARTURE_RADIUS");

    const auto cfg = orbint::detail::config_from_env();
    EXPECT_EQ(cfg.feasibility_threshold, 0.02);
    EXPECT_EQ(cfg.delta_v_margin, 2.);
    EXPECT_EQ(cfg.departure_radius, 1.);

    ::setenv("ORBINT_DEPARTURE_RADIUS", "one", 1);
    EXPECT_THROW((void)orbint::detail::config_from_env(), std::invalid_argument);

    ::setenv("ORBINT_DEPARTURE_RADIUS", "-1", 1);
    EXPECT_THROW((void)orbint::detail::config_from_env(), std::invalid_argument);

    ::unsetenv("ORBINT_FEASIBILITY_THRESHOLD");
    ::unsetenv("ORBINT_DELTA_V_MARGIN");
    ::unsetenv("ORBINT_DEPARTURE_RADIUS");
}

TEST(Config, DefaultGetterSetter)
{
    const auto orig = orbint::get_default_config();

    auto cfg = orig;
    cfg.feasibility_threshold = 0.05;
    orbint::set_default_config(cfg);
    EXPECT_EQ(orbint::get_default_config().feasibility_threshold, 0.05);

    cfg.g0 = -1.;
    EXPECT_THROW(orbint::set_default_config(cfg), std::invalid_argument);
    EXPECT_EQ(orbint::get_default_config().feasibility_threshold, 0.05);

    orbint::set_default_config(orig);
    EXPECT_EQ(orbint::get_default_config().feasibility_threshold, orig.feasibility_threshold);
}
