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

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/numeric/conversion/cast.hpp>

#include <fmt/core.h>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include "common_utils.hpp"
#include "trajectory.hpp"

namespace orbint_py
{

namespace py = pybind11;

void check_array_cc_aligned(const py::array &arr, const char *msg)
{
    if (!py::cast<bool>(arr.attr("flags").attr("aligned")) || !py::cast<bool>(arr.attr("flags").attr("c_contiguous")))
        [[unlikely]] {
        throw std::invalid_argument(msg);
    }
}

orbint::trajectory array_to_trajectory(const py::array_t<double> &arr, orbint::frame_tag frame, const char *name)
{
    if (arr.ndim() != 2 || arr.shape(1) != 7) [[unlikely]] {
        throw std::invalid_argument(
            fmt::format("The {} array must have shape (n, 7), but it has {} dimension(s) instead", name, arr.ndim()));
    }

    check_array_cc_aligned(arr, fmt::format("The {} array must be C contiguous and properly aligned", name).c_str());

    const auto n = boost::numeric_cast<std::size_t>(arr.shape(0));
    const auto *data = arr.data();

    std::vector<orbint::state_vector> states;
    states.reserve(n);

    for (std::size_t i = 0; i < n; ++i) {
        const auto *row = data + i * 7u;

        states.push_back(orbint::state_vector{.t = row[0],
                                              .r = {row[1], row[2], row[3]},
                                              .v = {row[4], row[5], row[6]},
                                              .source = orbint::state_source::external});
    }

    return orbint::trajectory(std::move(states), frame);
}

py::array_t<double> trajectory_to_array(const orbint::trajectory &traj)
{
    const auto n = boost::numeric_cast<py::ssize_t>(traj.size());

    py::array_t<double> ret(py::array::ShapeContainer{n, static_cast<py::ssize_t>(7)});
    auto *out = ret.mutable_data();

    for (const auto &sv : traj) {
        *out++ = sv.t;
        for (auto x : sv.r) {
            *out++ = x;
        }
        for (auto x : sv.v) {
            *out++ = x;
        }
    }

    return ret;
}

} // namespace orbint_py
