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

#ifndef ORBINT_TRAJECTORY_HPP
#define ORBINT_TRAJECTORY_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace orbint
{

// Provenance of a state vector. Not used in computations.
enum class state_source : std::int32_t { propagated = 0, ephemeris = 1, external = 2 };

// Reference frame of a trajectory. Not used in computations.
enum class frame_tag : std::int32_t { heliocentric_ecliptic = 0, geocentric_equatorial = 1, unspecified = 2 };

// Cartesian state of an object at an instant.
struct state_vector {
    // Julian date.
    double t = 0;
    // Position and velocity. For heliocentric work
    // these are in AU and AU/day.
    std::array<double, 3> r{};
    std::array<double, 3> v{};
    state_source source = state_source::propagated;
};

[[nodiscard]] double distance(const std::array<double, 3> &, const std::array<double, 3> &);
[[nodiscard]] double norm(const std::array<double, 3> &);

// Time-ordered sequence of state vectors. Timestamps are strictly increasing
// and all values are finite.
class trajectory
{
    std::vector<state_vector> m_states;
    frame_tag m_frame = frame_tag::heliocentric_ecliptic;

public:
    // A raw sample: t, x, y, z, vx, vy, vz.
    using sample_t = std::array<double, 7>;

    trajectory() = default;
    explicit trajectory(std::vector<state_vector>, frame_tag = frame_tag::heliocentric_ecliptic);
    explicit trajectory(std::span<const sample_t>, frame_tag = frame_tag::heliocentric_ecliptic,
                        state_source = state_source::ephemeris);

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const state_vector &operator[](std::size_t) const;
    [[nodiscard]] const state_vector &front() const;
    [[nodiscard]] const state_vector &back() const;
    [[nodiscard]] auto begin() const noexcept
    {
        return m_states.begin();
    }
    [[nodiscard]] auto end() const noexcept
    {
        return m_states.end();
    }

    [[nodiscard]] frame_tag get_frame() const noexcept;
    [[nodiscard]] const std::vector<state_vector> &get_states() const noexcept;
    [[nodiscard]] std::vector<sample_t> to_samples() const;

    [[nodiscard]] std::size_t nearest_index(double) const;
    [[nodiscard]] trajectory slice(double, double) const;
};

} // namespace orbint

#endif
