/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "flow/kernel/backend_registry.hpp"

namespace flow::kernel {

enum class KernelState : uint8_t {
    UNINITIALIZED,
    CONNECTED,
    CLOSED,
};

std::string to_string(KernelState state);

/**
 * Simulator-independent entry point for a training loop.
 *
 * Typical use:
 *   Kernel kernel("traci", config);
 *   kernel.pass_connection(kernel.start_simulation());
 *   kernel.update(true);
 *   while (...) kernel.step();
 *   kernel.close();
 *
 * One Kernel drives exactly one engine process. Run several engines by
 * creating several kernels, each with its own port.
 */
class Kernel {
public:
    // Throws ConfigurationError for an invalid config or an unknown backend, before anything is launched.
    Kernel(const std::string& backend, SimulationConfig config);
    Kernel(const std::string& backend, SimulationConfig config, const BackendRegistry& registry);
    ~Kernel();

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Starts the engine with the kernel's config.
    ConnectionHandle start_simulation();

    // Hands the session to simulation control, vehicle, traffic light and simulation state, in that order.
    void pass_connection(const ConnectionHandle& connection);

    // Advances the engine one step and refreshes every subsystem.
    void step(bool reset = false);

    // Refreshes vehicle, traffic light, simulation state and simulation control, in that order.
    void update(bool reset);

    bool check_collision() const;

    // Closes simulation state, then simulation control. Teardown errors are logged.
    void close();

    KernelState get_state() const { return state_; }
    const std::string& get_backend_name() const { return backend_name_; }
    const SimulationConfig& get_config() const { return config_; }
    const ConnectionHandle& get_connection() const { return connection_; }

    SimControl& sim_control() { return *backend_.sim_control; }
    const SimControl& sim_control() const { return *backend_.sim_control; }
    VehicleState& vehicle() { return *backend_.vehicle; }
    const VehicleState& vehicle() const { return *backend_.vehicle; }
    TrafficLightState& traffic_light() { return *backend_.traffic_light; }
    const TrafficLightState& traffic_light() const { return *backend_.traffic_light; }
    SimulationState& simulation() { return *backend_.simulation; }
    const SimulationState& simulation() const { return *backend_.simulation; }

private:
    void ensure_connected(const char* operation) const;

    std::string backend_name_;
    SimulationConfig config_;
    KernelBackend backend_;
    KernelState state_ = KernelState::UNINITIALIZED;
    ConnectionHandle connection_;
};

}  // namespace flow::kernel
