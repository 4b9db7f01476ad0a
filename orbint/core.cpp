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

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "expose_mission.hpp"
#include "expose_propagation.hpp"
#include "expose_tle.hpp"
#include "logging.hpp"

PYBIND11_MODULE(core, m)
{
    namespace py = pybind11;
    namespace ob = orbint;
    namespace obpy = orbint_py;

    // Disable automatic function signatures in the docs.
    // NOTE: the 'options' object needs to stay alive
    // throughout the whole definition of the module.
    py::options options;
    options.disable_function_signatures();

    m.doc() = "The core orbint module";

    // Elements, Kepler's equation and propagation.
    obpy::expose_propagation(m);

    // Intercept search, cost estimation and launch windows.
    obpy::expose_mission(m);

    // TLE parsing.
    obpy::expose_tle(m);

    // Logging utils.
    m.def("set_logger_level_info", &ob::set_logger_level_info);
    m.def("set_logger_level_trace", &ob::set_logger_level_trace);
    m.def("set_logger_level_debug", &ob::set_logger_level_debug);
    m.def("set_logger_level_warning", &ob::set_logger_level_warning);
}
