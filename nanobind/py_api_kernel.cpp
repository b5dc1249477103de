// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <nanobind/nanobind.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/kernel.hpp"

namespace nb = nanobind;

using namespace flow::kernel;

void bind_kernel(nb::module_ &m) {
    auto kernel_error = nb::exception<KernelError>(m, "KernelError");
    nb::exception<ConfigurationError>(m, "ConfigurationError", kernel_error);
    nb::exception<SpawnError>(m, "SpawnError", kernel_error);
    nb::exception<ConnectError>(m, "ConnectError", kernel_error);
    nb::exception<NotStartedError>(m, "NotStartedError", kernel_error);
    nb::exception<ProtocolError>(m, "ProtocolError", kernel_error);

    nb::enum_<KernelState>(m, "KernelState")
        .value("UNINITIALIZED", KernelState::UNINITIALIZED)
        .value("CONNECTED", KernelState::CONNECTED)
        .value("CLOSED", KernelState::CLOSED);

    nb::class_<protocol::Position2D>(m, "Position2D")
        .def_ro("x", &protocol::Position2D::x)
        .def_ro("y", &protocol::Position2D::y);

    // Only obtainable from a Kernel; it keeps the engine session alive.
    nb::class_<ConnectionHandle>(m, "ConnectionHandle")
        .def("is_valid", &ConnectionHandle::is_valid)
        .def("is_closed", &ConnectionHandle::is_closed);

    nb::class_<VehicleState>(m, "VehicleState")
        .def("get_ids", &VehicleState::get_ids)
        .def("get_num_vehicles", &VehicleState::get_num_vehicles)
        .def("get_departed_ids", &VehicleState::get_departed_ids)
        .def("get_arrived_ids", &VehicleState::get_arrived_ids)
        .def("get_speed", &VehicleState::get_speed, nb::arg("vehicle_id"))
        .def("get_position", &VehicleState::get_position, nb::arg("vehicle_id"))
        .def("get_edge", &VehicleState::get_edge, nb::arg("vehicle_id"))
        .def("get_lane", &VehicleState::get_lane, nb::arg("vehicle_id"))
        .def("get_lane_position", &VehicleState::get_lane_position, nb::arg("vehicle_id"))
        .def("get_route", &VehicleState::get_route, nb::arg("vehicle_id"));

    nb::class_<TrafficLightState>(m, "TrafficLightState")
        .def("get_ids", &TrafficLightState::get_ids)
        .def("get_state", &TrafficLightState::get_state, nb::arg("traffic_light_id"));

    nb::class_<SimulationState>(m, "SimulationState")
        .def("get_time", &SimulationState::get_time)
        .def("get_step_length", &SimulationState::get_step_length)
        .def("get_step_count", &SimulationState::get_step_count);

    nb::class_<Kernel>(m, "Kernel")
        .def(
            nb::init<const std::string &, SimulationConfig>(),
            nb::arg("backend"),
            nb::arg("config"),
            "Creates a kernel. Raises ConfigurationError for an unknown backend or invalid config.")
        .def("start_simulation", &Kernel::start_simulation, "Launches the engine and returns its session.")
        .def("pass_connection", &Kernel::pass_connection, nb::arg("connection"))
        .def("step", &Kernel::step, nb::arg("reset") = false)
        .def("update", &Kernel::update, nb::arg("reset"))
        .def("check_collision", &Kernel::check_collision)
        .def("close", &Kernel::close)
        .def_prop_ro("state", &Kernel::get_state)
        .def_prop_ro("backend_name", &Kernel::get_backend_name)
        .def_prop_ro("vehicle", nb::overload_cast<>(&Kernel::vehicle), nb::rv_policy::reference_internal)
        .def_prop_ro(
            "traffic_light", nb::overload_cast<>(&Kernel::traffic_light), nb::rv_policy::reference_internal)
        .def_prop_ro("simulation", nb::overload_cast<>(&Kernel::simulation), nb::rv_policy::reference_internal);
}
