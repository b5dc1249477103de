/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/simulation_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <fstream>
#include <sstream>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace flow::kernel {

namespace {

constexpr const char* TEST_MODE_ENV = "FLOW_KERNEL_TEST_MODE";
constexpr const char* PORT_ENV = "FLOW_KERNEL_PORT";

std::chrono::milliseconds seconds_to_ms(double seconds) {
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

EngineBinary parse_engine_binary(const std::string& name) {
    if (name == "headless") {
        return EngineBinary::HEADLESS;
    }
    if (name == "rendered") {
        return EngineBinary::RENDERED;
    }
    FLOW_THROW_AS(ConfigurationError, "Unknown engine_binary '{}', expected 'headless' or 'rendered'", name);
}

template <typename T>
void read_optional(const YAML::Node& node, const char* key, T& value) {
    if (node[key]) {
        value = node[key].as<T>();
    }
}

template <typename T>
void read_optional(const YAML::Node& node, const char* key, std::optional<T>& value) {
    if (node[key] && !node[key].IsNull()) {
        value = node[key].as<T>();
    }
}

SimulationConfig parse_config_node(const YAML::Node& root) {
    SimulationConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        FLOW_THROW_AS(ConfigurationError, "Simulation config must be a YAML map");
    }

    // Accept either a top-level map or one nested under "simulation".
    const YAML::Node node = root["simulation"] ? root["simulation"] : root;

    if (node["engine_binary"]) {
        config.engine_binary = parse_engine_binary(node["engine_binary"].as<std::string>());
    }
    if (node["render"] && node["render"].as<bool>()) {
        config.engine_binary = EngineBinary::RENDERED;
    }
    read_optional(node, "headless_binary", config.headless_binary);
    read_optional(node, "rendered_binary", config.rendered_binary);

    if (node["network_config"]) {
        config.network_config = node["network_config"].as<std::string>();
    }
    read_optional(node, "scenario_name", config.scenario_name);

    read_optional(node, "host", config.host);
    read_optional(node, "port", config.port);
    read_optional(node, "num_clients", config.num_clients);
    read_optional(node, "client_order", config.client_order);

    read_optional(node, "step_length", config.step_length);
    read_optional(node, "lateral_resolution", config.lateral_resolution);
    if (node["emission_path"] && !node["emission_path"].IsNull()) {
        config.emission_path = std::filesystem::path(node["emission_path"].as<std::string>());
    }
    read_optional(node, "seed", config.seed);

    read_optional(node, "no_step_log", config.no_step_log);
    read_optional(node, "print_warnings", config.print_warnings);
    read_optional(node, "overtake_right", config.overtake_right);
    read_optional(node, "teleport_time", config.teleport_time);

    if (node["settle_delay"]) {
        config.settle_delay = seconds_to_ms(node["settle_delay"].as<double>());
    }
    read_optional(node, "test_mode", config.test_mode);
    read_optional(node, "connect_attempts", config.connect_attempts);
    if (node["connect_retry_delay"]) {
        config.connect_retry_delay = seconds_to_ms(node["connect_retry_delay"].as<double>());
    }

    return config;
}

}  // namespace

void SimulationConfig::validate() const {
    if (port <= 0 || port > 65535) {
        FLOW_THROW_AS(ConfigurationError, "Port must be in [1, 65535], got {}", port);
    }
    if (!(step_length > 0)) {
        FLOW_THROW_AS(ConfigurationError, "Step length must be positive, got {}", step_length);
    }
    if (num_clients < 1) {
        FLOW_THROW_AS(ConfigurationError, "Client count must be at least 1, got {}", num_clients);
    }
    if (lateral_resolution.has_value() && !(*lateral_resolution > 0)) {
        FLOW_THROW_AS(ConfigurationError, "Lateral resolution must be positive, got {}", *lateral_resolution);
    }
    if (settle_delay.count() < 0 || connect_retry_delay.count() < 0) {
        FLOW_THROW_AS(ConfigurationError, "Startup delays must not be negative");
    }
    if (connect_attempts < 1) {
        FLOW_THROW_AS(ConfigurationError, "Connect attempts must be at least 1, got {}", connect_attempts);
    }
    if (get_engine_binary().empty()) {
        FLOW_THROW_AS(ConfigurationError, "Engine binary name is empty");
    }
    if (host.empty()) {
        FLOW_THROW_AS(ConfigurationError, "Engine host is empty");
    }
}

const std::string& SimulationConfig::get_engine_binary() const {
    return engine_binary == EngineBinary::RENDERED ? rendered_binary : headless_binary;
}

std::chrono::milliseconds SimulationConfig::get_settle_delay() const {
    return test_mode ? timeout::TEST_MODE_SETTLE_DELAY : settle_delay;
}

SimulationConfig SimulationConfig::from_yaml_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        FLOW_THROW_AS(ConfigurationError, "Simulation config file not found: {}", path.string());
    }
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    FLOW_DEBUG("Loading simulation config from {}", path.string());
    return from_yaml_string(buffer.str());
}

SimulationConfig SimulationConfig::from_yaml_string(const std::string& yaml_content) {
    SimulationConfig config;
    try {
        config = parse_config_node(YAML::Load(yaml_content));
    } catch (const YAML::Exception& e) {
        FLOW_THROW_AS(ConfigurationError, "Malformed simulation config: {}", e.what());
    }
    config.validate();
    return config;
}

void apply_environment_overrides(SimulationConfig& config) {
    if (utils::get_env_flag(TEST_MODE_ENV)) {
        config.test_mode = true;
        FLOW_DEBUG("{} set, using test-mode settle delay", TEST_MODE_ENV);
    }

    const std::optional<std::string> port = utils::get_env_var_value(PORT_ENV);
    if (port.has_value()) {
        try {
            config.port = std::stoi(*port);
        } catch (const std::exception&) {
            FLOW_THROW_AS(ConfigurationError, "{} is not a valid port: '{}'", PORT_ENV, *port);
        }
        FLOW_INFO("Using port {} from {}", config.port, PORT_ENV);
    }
}

}  // namespace flow::kernel
