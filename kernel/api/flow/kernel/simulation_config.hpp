/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "flow/kernel/utils/timeouts.hpp"

namespace flow::kernel {

enum class EngineBinary : uint8_t {
    HEADLESS,
    RENDERED,
};

/**
 * Everything needed to launch one engine instance and talk to it.
 *
 * The object is a plain value: the kernel copies it at construction and never
 * mutates its copy. Call validate() (the kernel does) before using it.
 */
struct SimulationConfig {
    EngineBinary engine_binary = EngineBinary::HEADLESS;
    std::string headless_binary = "sumo";
    std::string rendered_binary = "sumo-gui";

    // Engine input produced by the network generator. Passed as "-c <file>" when set.
    std::filesystem::path network_config;
    // Names the emission file "<scenario_name>-emission.xml".
    std::string scenario_name = "flow";

    std::string host = "localhost";
    int port = 8813;
    int num_clients = 1;
    int client_order = 0;

    // Seconds of simulated time per step.
    double step_length = 0.1;
    std::optional<double> lateral_resolution;
    // Directory receiving the emission file; created on start if absent.
    std::optional<std::filesystem::path> emission_path;
    std::optional<int> seed;

    bool no_step_log = true;
    bool print_warnings = false;
    bool overtake_right = false;
    // Seconds before a jammed vehicle is teleported. Negative disables teleporting.
    double teleport_time = -1;

    std::chrono::milliseconds settle_delay = timeout::ENGINE_SETTLE_DELAY;
    bool test_mode = false;

    int connect_attempts = 100;
    std::chrono::milliseconds connect_retry_delay = timeout::CONNECT_RETRY_DELAY;

    // Throws ConfigurationError describing the first violated constraint.
    void validate() const;

    // Binary selected by engine_binary.
    const std::string& get_engine_binary() const;

    // Delay between spawning the engine and the first connect attempt.
    std::chrono::milliseconds get_settle_delay() const;

    static SimulationConfig from_yaml_file(const std::filesystem::path& path);
    static SimulationConfig from_yaml_string(const std::string& yaml_content);
};

/**
 * Applies FLOW_KERNEL_TEST_MODE and FLOW_KERNEL_PORT from the environment.
 * Never called implicitly; tools and bindings opt in.
 */
void apply_environment_overrides(SimulationConfig& config);

}  // namespace flow::kernel
