// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <nanobind/nanobind.h>

#include "logger.hpp"

namespace nb = nanobind;

void bind_logging(nb::module_ &m) {
    auto logging_module = m.def_submodule("logging", "Flow kernel logging configuration");

    nb::enum_<spdlog::level::level_enum>(logging_module, "Level")
        .value("TRACE", spdlog::level::trace, "Most detailed logging level, including every protocol exchange")
        .value("DEBUG", spdlog::level::debug, "Engine command lines, connect attempts and subsystem resets")
        .value("INFO", spdlog::level::info, "Engine start and stop")
        .value("WARN", spdlog::level::warn, "Failed startup attempts and missing engine values")
        .value("ERROR", spdlog::level::err, "Failed startup and teardown errors")
        .value("CRITICAL", spdlog::level::critical, "Critical errors")
        .value("OFF", spdlog::level::off, "Disables all logging");

    logging_module.def(
        "set_level",
        &flow::logger::set_level,
        nb::arg("lvl"),
        "Sets the global logging level. Messages with severity levels lower than this level will not be logged.");
}
