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
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "common_utils.hpp"
#include "config.hpp"
#include "cost.hpp"
#include "elements.hpp"
#include "expose_mission.hpp"
#include "intercept.hpp"
#include "launch_windows.hpp"
#include "mission.hpp"
#include "trajectory.hpp"
#include "uncertainty.hpp"

namespace orbint_py
{

void expose_mission(pybind11::module_ &m)
{
    namespace py = pybind11;
    namespace ob = orbint;
    // NOLINTNEXTLINE(google-build-using-namespace)
    using namespace py::literals;

    // Mission configuration.
    py::class_<ob::score_tier>(m, "score_tier")
        .def(py::init([](double max_miss_distance, double score) {
                 return ob::score_tier{.max_miss_distance = max_miss_distance, .score = score};
             }),
             "max_miss_distance"_a, "score"_a)
        .def_readwrite("max_miss_distance", &ob::score_tier::max_miss_distance)
        .def_readwrite("score", &ob::score_tier::score);

    py::class_<ob::mission_config>(m, "mission_config")
        .def(py::init<>())
        .def_readwrite("mu", &ob::mission_config::mu)
        .def_readwrite("departure_radius", &ob::mission_config::departure_radius)
        .def_readwrite("delta_v_margin", &ob::mission_config::delta_v_margin)
        .def_readwrite("feasibility_threshold", &ob::mission_config::feasibility_threshold)
        .def_readwrite("isp_table", &ob::mission_config::isp_table)
        .def_readwrite("score_tiers", &ob::mission_config::score_tiers)
        .def_readwrite("fallback_score", &ob::mission_config::fallback_score)
        .def_readwrite("g0", &ob::mission_config::g0);

    m.def("get_default_config", &ob::get_default_config);
    m.def("set_default_config", &ob::set_default_config, "cfg"_a);

    // Results.
    py::class_<ob::cost_estimate>(m, "cost_estimate")
        .def_readonly("delta_v", &ob::cost_estimate::delta_v)
        .def_readonly("flight_time", &ob::cost_estimate::flight_time)
        .def_readonly("fuel_fraction", &ob::cost_estimate::fuel_fraction)
        .def_readonly("success_score", &ob::cost_estimate::success_score);

    py::class_<ob::closest_approach>(m, "closest_approach")
        .def_readonly("target_idx", &ob::closest_approach::target_idx)
        .def_readonly("interceptor_idx", &ob::closest_approach::interceptor_idx)
        .def_property_readonly("target_time", [](const ob::closest_approach &ca) { return ca.target.t; })
        .def_property_readonly("interceptor_time", [](const ob::closest_approach &ca) { return ca.interceptor.t; })
        .def_property_readonly("target_position", [](const ob::closest_approach &ca) { return ca.target.r; })
        .def_property_readonly("interceptor_position",
                               [](const ob::closest_approach &ca) { return ca.interceptor.r; })
        .def_readonly("miss_distance", &ob::closest_approach::miss_distance)
        .def_readonly("relative_speed", &ob::closest_approach::relative_speed);

    py::class_<ob::intercept_result>(m, "intercept_result")
        .def_readonly("approach", &ob::intercept_result::approach)
        .def_readonly("feasible", &ob::intercept_result::feasible)
        .def_readonly("cost", &ob::intercept_result::cost);

    py::class_<ob::launch_window>(m, "launch_window")
        .def_readonly("departure_time", &ob::launch_window::departure_time)
        .def_readonly("intercept_time", &ob::launch_window::intercept_time)
        .def_readonly("feasible", &ob::launch_window::feasible)
        .def_readonly("miss_distance", &ob::launch_window::miss_distance)
        .def_readonly("relative_speed", &ob::launch_window::relative_speed)
        .def_readonly("cost", &ob::launch_window::cost);

    // Engine functions. The config defaults to the process-wide default.
    m.def(
        "find_closest_approach",
        [](const py::array_t<double> &target, const py::array_t<double> &interceptor, ob::frame_tag frame) {
            const auto tgt = array_to_trajectory(target, frame, "target");
            const auto itc = array_to_trajectory(interceptor, frame, "interceptor");

            const py::gil_scoped_release release;

            return ob::find_closest_approach(tgt, itc);
        },
        "target"_a, "interceptor"_a, "frame"_a = ob::frame_tag::heliocentric_ecliptic);

    m.def(
        "evaluate_intercept",
        [](const py::array_t<double> &target, const py::array_t<double> &interceptor, const std::string &propulsion,
           std::optional<ob::mission_config> cfg) {
            const auto tgt = array_to_trajectory(target, ob::frame_tag::heliocentric_ecliptic, "target");
            const auto itc = array_to_trajectory(interceptor, ob::frame_tag::heliocentric_ecliptic, "interceptor");
            const auto c = cfg ? std::move(*cfg) : ob::get_default_config();

            const py::gil_scoped_release release;

            return ob::evaluate_intercept(tgt, itc, propulsion, c);
        },
        "target"_a, "interceptor"_a, "propulsion"_a = "ion", "cfg"_a = py::none());

    m.def(
        "plan_intercept",
        [](const py::array_t<double> &target, const ob::orbital_elements &interceptor, double epoch,
           double mission_duration, double step, double max_epoch_gap, std::string propulsion,
           std::optional<ob::mission_config> cfg) {
            const auto tgt = array_to_trajectory(target, ob::frame_tag::heliocentric_ecliptic, "target");
            const auto c = cfg ? std::move(*cfg) : ob::get_default_config();
            const ob::intercept_plan_params params{.mission_duration = mission_duration,
                                                   .step = step,
                                                   .max_epoch_gap = max_epoch_gap,
                                                   .propulsion = std::move(propulsion)};

            const py::gil_scoped_release release;

            return ob::plan_intercept(tgt, interceptor, epoch, params, c);
        },
        "target"_a, "interceptor"_a, "epoch"_a, "mission_duration"_a = 365., "step"_a = 1., "max_epoch_gap"_a = 1.,
        "propulsion"_a = "ion", "cfg"_a = py::none());

    m.def(
        "scan_launch_windows",
        [](const py::array_t<double> &target, const ob::orbital_elements &interceptor, double max_duration,
           double stride, double step, std::string propulsion, bool feasible_only,
           std::optional<ob::mission_config> cfg) {
            const auto tgt = array_to_trajectory(target, ob::frame_tag::heliocentric_ecliptic, "target");
            const auto c = cfg ? std::move(*cfg) : ob::get_default_config();
            const ob::window_scan_params params{.max_duration = max_duration,
                                                .stride = stride,
                                                .step = step,
                                                .propulsion = std::move(propulsion),
                                                .feasible_only = feasible_only};

            const py::gil_scoped_release release;

            return ob::scan_launch_windows(tgt, interceptor, params, c);
        },
        "target"_a, "interceptor"_a, "max_duration"_a = 365., "stride"_a = 30., "step"_a = 1.,
        "propulsion"_a = "ion", "feasible_only"_a = true, "cfg"_a = py::none());

    m.def(
        "estimate_cost",
        [](double target_radius, double miss_distance, const std::string &propulsion,
           std::optional<ob::mission_config> cfg) {
            return ob::estimate_cost(target_radius, miss_distance, propulsion,
                                     cfg ? *cfg : ob::get_default_config());
        },
        "target_radius"_a, "miss_distance"_a, "propulsion"_a = "ion", "cfg"_a = py::none());

    m.def("uncertainty_penalty", &ob::uncertainty_penalty, "chosen"_a, "likely"_a, "time_to_intercept"_a,
          "observation_arc"_a);
    m.def("penalised_success", &ob::penalised_success, "base"_a, "penalty"_a);
}

} // namespace orbint_py
