/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "flow/kernel/sim_control/sim_control.hpp"
#include "flow/kernel/simulation_config.hpp"
#include "flow/kernel/subsystem/kernel_subsystem.hpp"

namespace flow::kernel {

// The implementation set a Kernel drives. Every member must be set.
struct KernelBackend {
    std::unique_ptr<SimControl> sim_control;
    std::unique_ptr<VehicleState> vehicle;
    std::unique_ptr<TrafficLightState> traffic_light;
    std::unique_ptr<SimulationState> simulation;
};

// Builds a backend. Must not spawn processes or open connections.
using BackendFactory = std::function<KernelBackend(const SimulationConfig&)>;

class BackendRegistry {
public:
    // Replaces any backend already registered under the name.
    void register_backend(const std::string& name, BackendFactory factory);

    bool contains(const std::string& name) const;

    // Throws ConfigurationError for unknown names.
    KernelBackend create(const std::string& name, const SimulationConfig& config) const;

    std::vector<std::string> names() const;

private:
    std::map<std::string, BackendFactory> factories_;
};

// Name of the backend driving the engine over its TCP control protocol.
inline constexpr const char* TRACI_BACKEND = "traci";

// Shared registry, with TRACI_BACKEND registered.
BackendRegistry& default_registry();

KernelBackend create_traci_backend(const SimulationConfig& config);

}  // namespace flow::kernel
