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
#include <cstdlib>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/lexical_cast.hpp>

#include <fmt/core.h>

#include "config.hpp"
#include "logging.hpp"

namespace orbint
{

namespace detail
{

namespace
{

void check_positive(double x, const char *name)
{
    if (!std::isfinite(x) || x <= 0) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "Invalid mission configuration: the '{}' value must be finite and positive, but it is {} instead", name,
            x));
    }
}

void check_score(double x, const char *name)
{
    if (!std::isfinite(x) || x < 0 || x > 1) [[unlikely]] {
        throw std::invalid_argument(fmt::format(
            "Invalid mission configuration: the '{}' value must be in the [0, 1] range, but it is {} instead", name,
            x));
    }
}

// LCOV_EXCL_START

// Override cfg_value with the content of the env variable name, if set.
void read_env_value(double &cfg_value, const char *name)
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const auto *str = std::getenv(name);

    if (str == nullptr) {
        return;
    }

    try {
        cfg_value = boost::lexical_cast<double>(str);
    } catch (const boost::bad_lexical_cast &) {
        throw std::invalid_argument(
            fmt::format("The value '{}' of the environment variable {} cannot be parsed as a number", str, name));
    }

    log_debug("Mission configuration value read from the environment variable {}: {}", name, cfg_value);
}

// LCOV_EXCL_STOP

// The global default config, protected by a mutex. It is
// initialised from the environment on first access.
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
constinit std::mutex default_config_mutex;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables,cert-err58-cpp)
std::optional<mission_config> default_config;

} // namespace

mission_config config_from_env()
{
    mission_config ret;

    read_env_value(ret.feasibility_threshold, "ORBINT_FEASIBILITY_THRESHOLD");
    read_env_value(ret.delta_v_margin, "ORBINT_DELTA_V_MARGIN");
    read_env_value(ret.departure_radius, "ORBINT_DEPARTURE_RADIUS");

    check_config(ret);

    return ret;
}

} // namespace detail

void check_config(const mission_config &cfg)
{
    detail::check_positive(cfg.mu, "mu");
    detail::check_positive(cfg.departure_radius, "departure_radius");
    detail::check_positive(cfg.delta_v_margin, "delta_v_margin");
    detail::check_positive(cfg.feasibility_threshold, "feasibility_threshold");
    detail::check_positive(cfg.g0, "g0");

    if (cfg.isp_table.empty()) [[unlikely]] {
        throw std::invalid_argument("Invalid mission configuration: the specific impulse table is empty");
    }

    for (const auto &[tag, isp] : cfg.isp_table) {
        if (!std::isfinite(isp) || isp <= 0) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("Invalid mission configuration: the specific impulse of the propulsion type '{}' must be "
                            "finite and positive, but it is {} instead",
                            tag, isp));
        }
    }

    detail::check_score(cfg.fallback_score, "fallback_score");

    for (decltype(cfg.score_tiers.size()) i = 0; i < cfg.score_tiers.size(); ++i) {
        const auto &tier = cfg.score_tiers[i];

        detail::check_positive(tier.max_miss_distance, "score_tiers.max_miss_distance");
        detail::check_score(tier.score, "score_tiers.score");

        // NOTE: the score must not increase with the miss distance.
        const auto next_score = (i + 1u == cfg.score_tiers.size()) ? cfg.fallback_score : cfg.score_tiers[i + 1u].score;
        const auto next_ok
            = (i + 1u == cfg.score_tiers.size()) || tier.max_miss_distance < cfg.score_tiers[i + 1u].max_miss_distance;

        if (!next_ok || next_score > tier.score) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("Invalid mission configuration: the score tiers must have strictly increasing thresholds "
                            "and non-increasing scores, but tier {} violates this requirement",
                            i));
        }
    }
}

// Getter/setter for the default config, with mutex protection.
mission_config get_default_config()
{
    const std::lock_guard lock(detail::default_config_mutex);

    if (!detail::default_config) {
        detail::default_config = detail::config_from_env();
    }

    return *detail::default_config;
}

void set_default_config(mission_config cfg)
{
    check_config(cfg);

    const std::lock_guard lock(detail::default_config_mutex);

    detail::default_config = std::move(cfg);
}

} // namespace orbint
