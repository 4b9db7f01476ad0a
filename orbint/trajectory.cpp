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
#include <array>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "errors.hpp"
#include "trajectory.hpp"

namespace orbint
{

double norm(const std::array<double, 3> &x)
{
    return std::sqrt(x[0] * x[0] + x[1] * x[1] + x[2] * x[2]);
}

double distance(const std::array<double, 3> &a, const std::array<double, 3> &b)
{
    const auto dx = a[0] - b[0];
    const auto dy = a[1] - b[1];
    const auto dz = a[2] - b[2];

    return std::sqrt(dx * dx + dy * dy + dz * dz);
}

namespace detail
{

namespace
{

void check_states(const std::vector<state_vector> &states)
{
    for (decltype(states.size()) i = 0; i < states.size(); ++i) {
        const auto &sv = states[i];

        const auto finite = std::isfinite(sv.t) && std::ranges::all_of(sv.r, [](double x) { return std::isfinite(x); })
                            && std::ranges::all_of(sv.v, [](double x) { return std::isfinite(x); });
        if (!finite) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("A non-finite value was detected in the state vector at index {} of a trajectory", i));
        }

        if (i > 0u && !(states[i - 1u].t < sv.t)) [[unlikely]] {
            throw std::invalid_argument(
                fmt::format("The timestamps of a trajectory must be strictly increasing, but the state at index {} "
                            "has a timestamp of {} while the previous state has a timestamp of {}",
                            i, sv.t, states[i - 1u].t));
        }
    }
}

} // namespace

} // namespace detail

trajectory::trajectory(std::vector<state_vector> states, frame_tag frame)
    : m_states(std::move(states)), m_frame(frame)
{
    detail::check_states(m_states);
}

trajectory::trajectory(std::span<const sample_t> samples, frame_tag frame, state_source source) : m_frame(frame)
{
    m_states.reserve(samples.size());

    for (const auto &s : samples) {
        m_states.push_back(state_vector{.t = s[0], .r = {s[1], s[2], s[3]}, .v = {s[4], s[5], s[6]}, .source = source});
    }

    detail::check_states(m_states);
}

std::size_t trajectory::size() const noexcept
{
    return m_states.size();
}

bool trajectory::empty() const noexcept
{
    return m_states.empty();
}

const state_vector &trajectory::operator[](std::size_t i) const
{
    if (i >= m_states.size()) [[unlikely]] {
        throw std::out_of_range(
            fmt::format("Cannot access the state at index {} of a trajectory of size {}", i, m_states.size()));
    }

    return m_states[i];
}

const state_vector &trajectory::front() const
{
    if (m_states.empty()) [[unlikely]] {
        throw insufficient_data("Cannot fetch the first state of an empty trajectory");
    }

    return m_states.front();
}

const state_vector &trajectory::back() const
{
    if (m_states.empty()) [[unlikely]] {
        throw insufficient_data("Cannot fetch the last state of an empty trajectory");
    }

    return m_states.back();
}

frame_tag trajectory::get_frame() const noexcept
{
    return m_frame;
}

const std::vector<state_vector> &trajectory::get_states() const noexcept
{
    return m_states;
}

std::vector<trajectory::sample_t> trajectory::to_samples() const
{
    std::vector<sample_t> ret;
    ret.reserve(m_states.size());

    for (const auto &sv : m_states) {
        ret.push_back({sv.t, sv.r[0], sv.r[1], sv.r[2], sv.v[0], sv.v[1], sv.v[2]});
    }

    return ret;
}

// Index of the state closest in time to t. On a tie, the earlier
// state is selected.
std::size_t trajectory::nearest_index(double t) const
{
    if (m_states.empty()) [[unlikely]] {
        throw insufficient_data("Cannot look up a state in an empty trajectory");
    }

    if (!std::isfinite(t)) [[unlikely]] {
        throw std::invalid_argument(fmt::format("Cannot look up a trajectory state at the non-finite time {}", t));
    }

    const auto it = std::ranges::lower_bound(m_states, t, {}, &state_vector::t);

    if (it == m_states.begin()) {
        return 0;
    }

    if (it == m_states.end()) {
        return m_states.size() - 1u;
    }

    const auto prev = std::prev(it);
    const auto idx = static_cast<std::size_t>(prev - m_states.begin());

    return (t - prev->t <= it->t - t) ? idx : idx + 1u;
}

// The states whose timestamps fall within [t_begin, t_end].
trajectory trajectory::slice(double t_begin, double t_end) const
{
    if (!std::isfinite(t_begin) || !std::isfinite(t_end) || t_end < t_begin) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("Invalid time interval [{}, {}] passed to trajectory::slice()", t_begin, t_end));
    }

    const auto b = std::ranges::lower_bound(m_states, t_begin, {}, &state_vector::t);
    const auto e = std::ranges::upper_bound(m_states, t_end, {}, &state_vector::t);

    trajectory ret;
    ret.m_frame = m_frame;
    if (b < e) {
        ret.m_states.assign(b, e);
    }

    return ret;
}

} // namespace orbint
