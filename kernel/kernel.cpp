/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/kernel.hpp"

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "logger.hpp"

namespace flow::kernel {

std::string to_string(KernelState state) {
    switch (state) {
        case KernelState::UNINITIALIZED:
            return "uninitialized";
        case KernelState::CONNECTED:
            return "connected";
        case KernelState::CLOSED:
            return "closed";
    }
    return "unknown";
}

Kernel::Kernel(const std::string& backend, SimulationConfig config) :
    Kernel(backend, std::move(config), default_registry()) {}

Kernel::Kernel(const std::string& backend, SimulationConfig config, const BackendRegistry& registry) :
    backend_name_(backend), config_(std::move(config)) {
    config_.validate();
    backend_ = registry.create(backend_name_, config_);
    FLOW_DEBUG("Kernel created with backend '{}'", backend_name_);
}

Kernel::~Kernel() {
    if (state_ == KernelState::CONNECTED) {
        close();
    }
}

ConnectionHandle Kernel::start_simulation() { return backend_.sim_control->start(config_); }

void Kernel::pass_connection(const ConnectionHandle& connection) {
    if (state_ != KernelState::UNINITIALIZED) {
        FLOW_THROW_AS(KernelError, "Cannot pass a connection to a kernel in state {}", to_string(state_));
    }
    if (!connection.is_valid()) {
        FLOW_THROW_AS(NotStartedError, "Cannot pass an empty connection; start the simulation first");
    }

    connection_ = connection;
    // Simulation control goes first: it sets up the subscriptions the vehicle state reads.
    backend_.sim_control->pass_connection(connection_);
    backend_.vehicle->pass_connection(connection_);
    backend_.traffic_light->pass_connection(connection_);
    backend_.simulation->pass_connection(connection_);
    state_ = KernelState::CONNECTED;
}

void Kernel::step(bool reset) {
    ensure_connected("step");
    backend_.sim_control->step();
    update(reset);
}

void Kernel::update(bool reset) {
    ensure_connected("update");
    backend_.vehicle->update(reset);
    backend_.traffic_light->update(reset);
    backend_.simulation->update(reset);
    backend_.sim_control->update(reset);
}

bool Kernel::check_collision() const { return backend_.sim_control->check_collision(); }

void Kernel::close() {
    if (state_ == KernelState::CLOSED) {
        FLOW_WARN("Kernel already closed");
        return;
    }
    ensure_connected("close");

    // Simulation state may still need the live session to flush.
    try {
        backend_.simulation->close();
    } catch (const std::exception& e) {
        FLOW_ERROR("Error closing simulation state: {}", e.what());
    }
    try {
        backend_.sim_control->close();
    } catch (const std::exception& e) {
        FLOW_ERROR("Error closing simulation control: {}", e.what());
    }

    connection_ = ConnectionHandle{};
    state_ = KernelState::CLOSED;
}

void Kernel::ensure_connected(const char* operation) const {
    if (state_ != KernelState::CONNECTED) {
        FLOW_THROW_AS(
            NotStartedError, "Kernel {} requires a connected simulation, current state is {}", operation, to_string(state_));
    }
}

}  // namespace flow::kernel
