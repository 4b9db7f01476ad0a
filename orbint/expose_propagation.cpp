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

#include <array>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common_utils.hpp"
#include "elements.hpp"
#include "expose_propagation.hpp"
#include "kepler.hpp"
#include "propagator.hpp"
#include "trajectory.hpp"
#include "units.hpp"

namespace orbint_py
{

void expose_propagation(pybind11::module_ &m)
{
    namespace py = pybind11;
    namespace ob = orbint;
    // NOLINTNEXTLINE(google-build-using-namespace)
    using namespace py::literals;

    py::enum_<ob::anomaly_kind>(m, "anomaly_kind")
        .value("mean_anomaly", ob::anomaly_kind::mean_anomaly)
        .value("true_anomaly", ob::anomaly_kind::true_anomaly);

    py::enum_<ob::angle_unit>(m, "angle_unit")
        .value("radians", ob::angle_unit::radians)
        .value("degrees", ob::angle_unit::degrees);

    py::enum_<ob::frame_tag>(m, "frame_tag")
        .value("heliocentric_ecliptic", ob::frame_tag::heliocentric_ecliptic)
        .value("geocentric_equatorial", ob::frame_tag::geocentric_equatorial)
        .value("unspecified", ob::frame_tag::unspecified);

    // Orbital elements.
    py::class_<ob::orbital_elements> el_cl(m, "orbital_elements");
    el_cl.def(py::init([](double a, double e, double i, double node, double argp, double anomaly,
                          ob::anomaly_kind kind, double epoch, ob::angle_unit unit) {
                  auto ret = ob::make_elements(a, e, i, node, argp, anomaly, kind, epoch, unit);
                  ob::check_elements(ret);
                  return ret;
              }),
              "a"_a, "e"_a, "i"_a, "node"_a, "argp"_a, "anomaly"_a, "kind"_a = ob::anomaly_kind::mean_anomaly,
              "epoch"_a = 0., "unit"_a = ob::angle_unit::radians);
    el_cl.def_readonly("a", &ob::orbital_elements::a);
    el_cl.def_readonly("e", &ob::orbital_elements::e);
    el_cl.def_readonly("i", &ob::orbital_elements::i);
    el_cl.def_readonly("node", &ob::orbital_elements::node);
    el_cl.def_readonly("argp", &ob::orbital_elements::argp);
    el_cl.def_readonly("anomaly", &ob::orbital_elements::anomaly);
    el_cl.def_readonly("kind", &ob::orbital_elements::kind);
    el_cl.def_readonly("epoch", &ob::orbital_elements::epoch);

    m.def("solve_kepler", &ob::solve_kepler, "M"_a, "e"_a);

    m.def(
        "propagate_state",
        [](const ob::orbital_elements &el, double t, double mu) {
            const auto sv = ob::propagate_state(el, t, mu);
            return py::make_tuple(sv.r, sv.v);
        },
        "el"_a, "t"_a, "mu"_a = ob::gm_sun_au3_day2);

    m.def(
        "propagate",
        [](const ob::orbital_elements &el, double begin, double end, double step, double mu, ob::frame_tag frame) {
            ob::trajectory traj;

            {
                // NOTE: release the GIL during propagation.
                const py::gil_scoped_release release;

                traj = ob::propagate(el, ob::time_grid{.begin = begin, .end = end, .step = step}, mu, frame);
            }

            return trajectory_to_array(traj);
        },
        "el"_a, "begin"_a, "end"_a, "step"_a = 1., "mu"_a = ob::gm_sun_au3_day2,
        "frame"_a = ob::frame_tag::heliocentric_ecliptic);

    m.def(
        "state_to_elements",
        [](double t, const std::array<double, 3> &r, const std::array<double, 3> &v, double mu) {
            return ob::state_to_elements(ob::state_vector{.t = t, .r = r, .v = v}, mu);
        },
        "t"_a, "r"_a, "v"_a, "mu"_a = ob::gm_sun_au3_day2);

    // Physical constants.
    m.attr("au_km") = ob::au_km;
    m.attr("gm_sun_au3_day2") = ob::gm_sun_au3_day2;
    m.attr("gm_earth_km3_day2") = ob::gm_earth_km3_day2;
}

} // namespace orbint_py
