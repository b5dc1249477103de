/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/subsystem/engine_simulation_state.hpp"

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"
#include "logger.hpp"

namespace flow::kernel {

using namespace protocol;

void EngineSimulationState::pass_connection(const ConnectionHandle& connection) { connection_ = connection; }

void EngineSimulationState::update(bool reset) {
    if (!connection_.is_valid()) {
        FLOW_THROW_AS(NotStartedError, "Simulation state updated before receiving a connection");
    }

    step_count_ = reset ? 0 : step_count_ + 1;

    const VariableMap* values = connection_.get_simulation_values();
    if (values == nullptr) {
        return;
    }

    // The engine reports the current time in milliseconds.
    auto time_step = values->find(VAR_TIME_STEP);
    if (time_step != values->end()) {
        if (std::optional<double> milliseconds = value_as_double(time_step->second)) {
            time_ = *milliseconds / 1000.0;
        }
    }
    auto delta = values->find(VAR_DELTA_T);
    if (delta != values->end()) {
        if (std::optional<double> seconds = value_as_double(delta->second)) {
            step_length_ = *seconds;
        }
    }
}

void EngineSimulationState::close() {
    FLOW_INFO("Simulation finished at t={}s after {} steps", time_, step_count_);
    connection_ = ConnectionHandle{};
}

}  // namespace flow::kernel
