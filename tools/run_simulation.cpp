// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <cxxopts.hpp>
#include <iostream>

#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/kernel.hpp"
#include "logger.hpp"

using namespace flow::kernel;

int main(int argc, char *argv[]) {
    cxxopts::Options options("run_simulation", "Start an engine, step it and report collisions.");

    options.add_options()("c,config", "YAML simulation config.", cxxopts::value<std::string>())(
        "b,backend", "Simulation backend.", cxxopts::value<std::string>()->default_value(TRACI_BACKEND))(
        "s,steps", "Number of steps to run.", cxxopts::value<int>()->default_value("100"))(
        "r,render", "Use the rendered engine binary.")("p,port", "Engine port.", cxxopts::value<int>())(
        "l,log-level", "trace, debug, info, warn, error, critical or off.", cxxopts::value<std::string>())(
        "h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << std::endl;
            return 0;
        }

        if (result.count("log-level")) {
            flow::logger::Options logger_options;
            logger_options.log_level = flow::logger::parse_level(result["log-level"].as<std::string>());
            flow::logger::initialize(logger_options);
        }

        SimulationConfig config;
        if (result.count("config")) {
            config = SimulationConfig::from_yaml_file(result["config"].as<std::string>());
        }
        apply_environment_overrides(config);
        if (result.count("render")) {
            config.engine_binary = EngineBinary::RENDERED;
        }
        if (result.count("port")) {
            config.port = result["port"].as<int>();
        }

        const int steps = result["steps"].as<int>();
        Kernel kernel(result["backend"].as<std::string>(), config);
        kernel.pass_connection(kernel.start_simulation());
        kernel.update(true);

        int collisions = 0;
        for (int i = 0; i < steps; ++i) {
            kernel.step();
            if (kernel.check_collision()) {
                ++collisions;
                FLOW_WARN(
                    "Collision at t={}s ({} vehicles in the network)",
                    kernel.simulation().get_time(),
                    kernel.vehicle().get_num_vehicles());
            }
        }

        FLOW_INFO("Ran {} steps, {} with collisions", steps, collisions);
        kernel.close();
    } catch (const std::exception &e) {
        FLOW_ERROR("Simulation failed: {}", e.what());
        return 1;
    }

    return 0;
}
