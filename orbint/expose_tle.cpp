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

#include <stdexcept>
#include <string>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>

#include "elements.hpp"
#include "expose_tle.hpp"
#include "julian.hpp"
#include "tle.hpp"
#include "units.hpp"

namespace orbint_py
{

void expose_tle(pybind11::module_ &m)
{
    namespace py = pybind11;
    namespace ob = orbint;
    // NOLINTNEXTLINE(google-build-using-namespace)
    using namespace py::literals;

    // Register the GPE dtype.
    using gpe = ob::gpe;
    PYBIND11_NUMPY_DTYPE(gpe, norad_id, epoch_jd, n0, e0, i0, node0, omega0, m0, bstar);
    m.attr("gpe_dtype") = py::dtype::of<gpe>();

    // NOTE: the GPE is returned as a single-element structured array.
    m.def(
        "parse_tle",
        [](const std::string &line1, const std::string &line2) {
            py::array_t<gpe> ret(1);
            *ret.mutable_data() = ob::parse_tle(line1, line2);
            return ret;
        },
        "line1"_a, "line2"_a);

    m.def(
        "gpe_to_elements",
        [](const py::array_t<gpe> &g, double mu) {
            if (g.size() != 1) [[unlikely]] {
                throw std::invalid_argument("gpe_to_elements() requires an array containing exactly one GPE");
            }

            return ob::gpe_to_elements(*g.data(), mu);
        },
        "gpe"_a.noconvert(), "mu"_a = ob::gm_earth_km3_day2);

    // Calendar dates.
    py::class_<ob::calendar_date>(m, "calendar_date")
        .def(py::init<>())
        .def_readwrite("year", &ob::calendar_date::year)
        .def_readwrite("month", &ob::calendar_date::month)
        .def_readwrite("day", &ob::calendar_date::day)
        .def_readwrite("hour", &ob::calendar_date::hour)
        .def_readwrite("minute", &ob::calendar_date::minute)
        .def_readwrite("second", &ob::calendar_date::second);

    m.def("calendar_to_jd", py::overload_cast<int, int, int, int, int, double>(&ob::calendar_to_jd), "year"_a,
          "month"_a, "day"_a, "hour"_a = 0, "minute"_a = 0, "second"_a = 0.);
    m.def("jd_to_calendar", &ob::jd_to_calendar, "jd"_a);
}

} // namespace orbint_py
