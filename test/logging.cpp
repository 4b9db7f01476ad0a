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

#include <orbint/logging.hpp>

#include <gtest/gtest.h>

#include <fmt/core.h>

TEST(Logging, Levels)
{
    const auto orig = orbint::get_logger_level();

    orbint::set_logger_level(orbint::log_level::trace);
    EXPECT_EQ(orbint::get_logger_level(), orbint::log_level::trace);

    orbint::set_logger_level_debug();
    EXPECT_EQ(orbint::get_logger_level(), orbint::log_level::debug);

    orbint::set_logger_level_warning();
    EXPECT_EQ(orbint::get_logger_level(), orbint::log_level::warning);

    orbint::set_logger_level_info();
    EXPECT_EQ(orbint::get_logger_level(), orbint::log_level::info);

    EXPECT_NO_THROW(orbint::log_info("logging at level {}", "info"));
    EXPECT_NO_THROW(orbint::log_trace("not shown: {}", 42));

    orbint::set_logger_level(orig);
}

TEST(Logging, Stopwatch)
{
    const orbint::stopwatch sw;

    const auto t1 = sw.elapsed_s();
    EXPECT_GE(t1, 0.);
    EXPECT_GE(sw.elapsed_s(), t1);

    EXPECT_FALSE(fmt::format("{}", sw).empty());
}
