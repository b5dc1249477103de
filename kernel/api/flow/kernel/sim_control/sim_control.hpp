/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "flow/kernel/protocol/connection.hpp"
#include "flow/kernel/simulation_config.hpp"

namespace flow::kernel {

enum class SimControlState : uint8_t {
    IDLE,
    STARTING,
    RUNNING,
    CLOSED,
};

std::string to_string(SimControlState state);

/**
 * Owns the engine process and the control-protocol session of one simulation.
 *
 * Backends implement this contract; the Kernel facade only talks to it
 * through these operations.
 */
class SimControl {
public:
    virtual ~SimControl() = default;

    /**
     * Launches the engine and opens a session to it, retrying failed attempts.
     * Once every attempt failed the error of the last attempt is rethrown as is.
     */
    virtual ConnectionHandle start(const SimulationConfig& config) = 0;

    // Registers the simulation-level subscriptions other subsystems rely on.
    virtual void pass_connection(const ConnectionHandle& connection) = 0;

    // Advances the engine by one step. Throws NotStartedError before a successful start().
    virtual void step() = 0;

    virtual void update(bool reset) = 0;

    // True iff some vehicle started teleporting during the last step.
    virtual bool check_collision() const = 0;

    // Closes the session and terminates the engine. Never throws.
    virtual void close() = 0;

    virtual SimControlState get_state() const = 0;
};

}  // namespace flow::kernel
