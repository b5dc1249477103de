/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/sim_control/engine_sim_control.hpp"

#include <thread>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"
#include "logger.hpp"

namespace flow::kernel {

namespace {

// Simulation-level signals refreshed by every step.
const std::vector<uint8_t> SIMULATION_SUBSCRIPTION = {
    protocol::VAR_DEPARTED_VEHICLES_IDS,
    protocol::VAR_ARRIVED_VEHICLES_IDS,
    protocol::VAR_TELEPORT_STARTING_VEHICLES_IDS,
    protocol::VAR_TIME_STEP,
    protocol::VAR_DELTA_T,
};

std::string describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    }
}

}  // namespace

EngineSimControl::EngineSimControl(
    std::unique_ptr<ProcessSupervisor> supervisor, std::unique_ptr<ProtocolConnector> connector) :
    supervisor_(std::move(supervisor)), connector_(std::move(connector)) {
    FLOW_ASSERT(supervisor_ != nullptr, "EngineSimControl requires a process supervisor");
    FLOW_ASSERT(connector_ != nullptr, "EngineSimControl requires a protocol connector");
}

EngineSimControl::~EngineSimControl() {
    // An interrupted start may leave a spawned engine behind.
    if (state_ == SimControlState::RUNNING || state_ == SimControlState::STARTING) {
        close();
    }
}

ConnectionHandle EngineSimControl::start(const SimulationConfig& config) {
    if (state_ != SimControlState::IDLE) {
        FLOW_THROW_AS(KernelError, "Cannot start a simulation control in state {}", to_string(state_));
    }
    config.validate();

    const EngineCommand command = build_engine_command(config);
    FLOW_INFO("Starting engine on port {}", config.port);
    if (config.num_clients > 1) {
        FLOW_INFO("Num clients are {}", config.num_clients);
    }
    if (!config.network_config.empty()) {
        FLOW_DEBUG("Cfg file: {}", config.network_config.string());
    }
    if (command.emission_file.has_value()) {
        FLOW_DEBUG("Emission file: {}", command.emission_file->string());
    }
    FLOW_DEBUG("Step length: {}", config.step_length);
    FLOW_DEBUG("Engine command: {}", command.str());

    state_ = SimControlState::STARTING;

    std::exception_ptr last_error;
    for (int attempt = 1; attempt <= STARTUP_ATTEMPTS; ++attempt) {
        AttemptResult result = try_start(config, command, attempt);
        if (result.connection != nullptr) {
            connection_ = std::move(result.connection);
            state_ = SimControlState::RUNNING;
            return ConnectionHandle(connection_);
        }

        last_error = result.error;
        FLOW_WARN(
            "Engine startup attempt {}/{} failed: {}", attempt, STARTUP_ATTEMPTS, describe(last_error));

        // Nothing from a failed attempt may survive into the next one.
        supervisor_->kill(process_);
        process_ = ProcessHandle{};
    }

    state_ = SimControlState::IDLE;
    FLOW_ERROR("Engine did not start after {} attempts", STARTUP_ATTEMPTS);
    std::rethrow_exception(last_error);
}

EngineSimControl::AttemptResult EngineSimControl::try_start(
    const SimulationConfig& config, const EngineCommand& command, int attempt) {
    AttemptResult result;
    std::shared_ptr<Connection> connection;
    try {
        process_ = supervisor_->spawn(command.binary, command.args);

        std::this_thread::sleep_for(config.get_settle_delay());
        if (!supervisor_->is_alive(process_)) {
            FLOW_THROW_AS(
                SpawnError, "Engine process {} exited before accepting connections (attempt {})", process_.pid, attempt);
        }

        connection = connector_->connect(config.port, config.connect_attempts);
        connection->set_order(config.client_order);
        connection->simulation_step();
        result.connection = std::move(connection);
    } catch (const std::exception&) {
        result.error = std::current_exception();
        if (connection != nullptr) {
            try {
                connection->close();
            } catch (const std::exception& e) {
                FLOW_DEBUG("Error closing partial engine session: {}", e.what());
            }
        }
    }
    return result;
}

void EngineSimControl::pass_connection(const ConnectionHandle& connection) {
    connection.subscribe(Domain::SIMULATION, "", SIMULATION_SUBSCRIPTION);
}

void EngineSimControl::step() {
    ensure_running("step");
    connection_->simulation_step();
}

void EngineSimControl::update(bool /*reset*/) {
    // Engine state lives in the engine; nothing is cached here.
}

bool EngineSimControl::check_collision() const {
    ensure_running("check_collision");

    const protocol::SubscriptionResults& results = connection_->get_subscription_results(Domain::SIMULATION);
    auto simulation = results.find("");
    if (simulation == results.end()) {
        return false;
    }
    auto teleports = simulation->second.find(protocol::VAR_TELEPORT_STARTING_VEHICLES_IDS);
    if (teleports == simulation->second.end()) {
        return false;
    }
    const std::vector<std::string>* ids = protocol::value_as_string_list(teleports->second);
    return ids != nullptr && !ids->empty();
}

void EngineSimControl::close() {
    if (state_ == SimControlState::CLOSED) {
        return;
    }

    if (connection_ != nullptr) {
        try {
            connection_->close();
        } catch (const std::exception& e) {
            FLOW_ERROR("Error during engine session teardown: {}", e.what());
        }
        connection_.reset();
    }

    supervisor_->kill(process_);
    process_ = ProcessHandle{};
    state_ = SimControlState::CLOSED;
}

void EngineSimControl::ensure_running(const char* operation) const {
    if (state_ != SimControlState::RUNNING) {
        FLOW_THROW_AS(
            NotStartedError, "{} requires a running simulation, current state is {}", operation, to_string(state_));
    }
}

}  // namespace flow::kernel
