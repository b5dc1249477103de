/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "flow/kernel/simulation_config.hpp"

namespace flow::kernel {

struct EngineCommand {
    std::string binary;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> emission_file;

    std::string str() const;
};

// Emission file written by the engine for this config, if emission output is requested.
std::optional<std::filesystem::path> get_emission_file(const SimulationConfig& config);

/**
 * Builds the engine invocation for one startup attempt.
 *
 * Creates the emission directory when emission output is configured, so the
 * engine never fails on a missing output location.
 */
EngineCommand build_engine_command(const SimulationConfig& config);

}  // namespace flow::kernel
