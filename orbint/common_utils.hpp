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

#ifndef ORBINT_PY_COMMON_UTILS_HPP
#define ORBINT_PY_COMMON_UTILS_HPP

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include "trajectory.hpp"

namespace orbint_py
{

void check_array_cc_aligned(const pybind11::array &, const char *);

// Build a trajectory from an (n, 7) array of samples {t, x, y, z, vx, vy, vz}.
// name identifies the argument in error messages.
orbint::trajectory array_to_trajectory(const pybind11::array_t<double> &, orbint::frame_tag, const char *name);

// Convert a trajectory into an (n, 7) array of samples.
pybind11::array_t<double> trajectory_to_array(const orbint::trajectory &);

} // namespace orbint_py

#endif
