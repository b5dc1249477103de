/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/backend_registry.hpp"

#include <fmt/ranges.h>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/process/engine_process_supervisor.hpp"
#include "flow/kernel/protocol/protocol_connector.hpp"
#include "flow/kernel/sim_control/engine_sim_control.hpp"
#include "flow/kernel/subsystem/engine_simulation_state.hpp"
#include "flow/kernel/subsystem/engine_traffic_light_state.hpp"
#include "flow/kernel/subsystem/engine_vehicle_state.hpp"

namespace flow::kernel {

void BackendRegistry::register_backend(const std::string& name, BackendFactory factory) {
    FLOW_ASSERT(!name.empty(), "Backend name must not be empty");
    FLOW_ASSERT(factory != nullptr, "Backend '{}' registered without a factory", name);
    factories_[name] = std::move(factory);
}

bool BackendRegistry::contains(const std::string& name) const { return factories_.count(name) > 0; }

KernelBackend BackendRegistry::create(const std::string& name, const SimulationConfig& config) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        const std::string available = fmt::format("{}", fmt::join(names(), ", "));
        FLOW_THROW_AS(ConfigurationError, "Unknown simulation backend '{}'. Available: {}", name, available);
    }

    KernelBackend backend = it->second(config);
    FLOW_ASSERT(
        backend.sim_control && backend.vehicle && backend.traffic_light && backend.simulation,
        "Backend '{}' returned an incomplete implementation set",
        name);
    return backend;
}

std::vector<std::string> BackendRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

KernelBackend create_traci_backend(const SimulationConfig& config) {
    KernelBackend backend;
    backend.sim_control = std::make_unique<EngineSimControl>(
        std::make_unique<EngineProcessSupervisor>(),
        std::make_unique<EngineConnector>(config.host, config.connect_retry_delay));
    backend.vehicle = std::make_unique<EngineVehicleState>();
    backend.traffic_light = std::make_unique<EngineTrafficLightState>();
    backend.simulation = std::make_unique<EngineSimulationState>();
    return backend;
}

BackendRegistry& default_registry() {
    static BackendRegistry registry = [] {
        BackendRegistry r;
        r.register_backend(TRACI_BACKEND, create_traci_backend);
        return r;
    }();
    return registry;
}

}  // namespace flow::kernel
