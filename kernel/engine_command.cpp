/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/engine_command.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <system_error>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"

namespace flow::kernel {

std::string EngineCommand::str() const { return fmt::format("{} {}", binary, fmt::join(args, " ")); }

std::optional<std::filesystem::path> get_emission_file(const SimulationConfig& config) {
    if (!config.emission_path.has_value()) {
        return std::nullopt;
    }
    return *config.emission_path / (config.scenario_name + "-emission.xml");
}

EngineCommand build_engine_command(const SimulationConfig& config) {
    EngineCommand command;
    command.binary = config.get_engine_binary();

    std::vector<std::string>& args = command.args;
    if (!config.network_config.empty()) {
        args.insert(args.end(), {"-c", config.network_config.string()});
    }
    args.insert(
        args.end(),
        {"--remote-port",
         std::to_string(config.port),
         "--num-clients",
         std::to_string(config.num_clients),
         "--step-length",
         fmt::format("{}", config.step_length)});

    if (config.no_step_log) {
        args.push_back("--no-step-log");
    }

    if (config.lateral_resolution.has_value()) {
        args.insert(args.end(), {"--lateral-resolution", fmt::format("{}", *config.lateral_resolution)});
    }

    command.emission_file = get_emission_file(config);
    if (command.emission_file.has_value()) {
        std::error_code ec;
        std::filesystem::create_directories(*config.emission_path, ec);
        if (ec) {
            FLOW_THROW_AS(
                ConfigurationError,
                "Cannot create emission directory {}: {}",
                config.emission_path->string(),
                ec.message());
        }
        args.insert(args.end(), {"--emission-output", command.emission_file->string()});
    }

    if (config.overtake_right) {
        args.insert(args.end(), {"--lanechange.overtake-right", "true"});
    }

    if (config.seed.has_value()) {
        args.insert(args.end(), {"--seed", std::to_string(*config.seed)});
    }

    if (!config.print_warnings) {
        args.insert(args.end(), {"--no-warnings", "true"});
    }

    args.insert(args.end(), {"--time-to-teleport", std::to_string(static_cast<int>(config.teleport_time))});
    args.insert(args.end(), {"--collision.check-junctions", "true"});

    return command;
}

}  // namespace flow::kernel
