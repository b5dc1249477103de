// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <nanobind/nanobind.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/filesystem.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>

#include "flow/kernel/simulation_config.hpp"
#include "utils.hpp"

namespace nb = nanobind;

using namespace flow::kernel;

void bind_config(nb::module_ &m) {
    nb::enum_<EngineBinary>(m, "EngineBinary")
        .value("HEADLESS", EngineBinary::HEADLESS)
        .value("RENDERED", EngineBinary::RENDERED);

    nb::class_<SimulationConfig>(m, "SimulationConfig")
        .def(nb::init<>())
        .def_rw("engine_binary", &SimulationConfig::engine_binary)
        .def_rw("headless_binary", &SimulationConfig::headless_binary)
        .def_rw("rendered_binary", &SimulationConfig::rendered_binary)
        .def_rw("network_config", &SimulationConfig::network_config)
        .def_rw("scenario_name", &SimulationConfig::scenario_name)
        .def_rw("host", &SimulationConfig::host)
        .def_rw("port", &SimulationConfig::port)
        .def_rw("num_clients", &SimulationConfig::num_clients)
        .def_rw("client_order", &SimulationConfig::client_order)
        .def_rw("step_length", &SimulationConfig::step_length)
        .def_rw("lateral_resolution", &SimulationConfig::lateral_resolution)
        .def_rw("emission_path", &SimulationConfig::emission_path)
        .def_rw("seed", &SimulationConfig::seed)
        .def_rw("no_step_log", &SimulationConfig::no_step_log)
        .def_rw("print_warnings", &SimulationConfig::print_warnings)
        .def_rw("overtake_right", &SimulationConfig::overtake_right)
        .def_rw("teleport_time", &SimulationConfig::teleport_time)
        .def_rw("settle_delay", &SimulationConfig::settle_delay)
        .def_rw("test_mode", &SimulationConfig::test_mode)
        .def_rw("connect_attempts", &SimulationConfig::connect_attempts)
        .def_rw("connect_retry_delay", &SimulationConfig::connect_retry_delay)
        .def("validate", &SimulationConfig::validate, "Raises if any field is out of range.")
        .def_static(
            "from_yaml_file",
            &SimulationConfig::from_yaml_file,
            nb::arg("path"),
            "Loads a config from a YAML file. Missing keys keep their defaults.")
        .def_static("from_yaml_string", &SimulationConfig::from_yaml_string, nb::arg("yaml_content"));

    m.def(
        "apply_environment_overrides",
        &apply_environment_overrides,
        nb::arg("config"),
        "Applies FLOW_KERNEL_TEST_MODE and FLOW_KERNEL_PORT to the config.");

    m.def(
        "find_free_port",
        [](int low, int high) { return flow::utils::find_free_port(low, high); },
        nb::arg("low") = 10000,
        nb::arg("high") = 60000,
        "Returns a random TCP port in [low, high] that nothing is bound to.");
}
