/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <exception>
#include <memory>

#include "flow/kernel/engine_command.hpp"
#include "flow/kernel/process/process_supervisor.hpp"
#include "flow/kernel/protocol/protocol_connector.hpp"
#include "flow/kernel/sim_control/sim_control.hpp"

namespace flow::kernel {

/**
 * SimControl for an engine launched as a child process and driven over TCP.
 *
 * Startup runs up to STARTUP_ATTEMPTS attempts. Each attempt spawns the
 * engine, waits for it to settle, checks that it is still running, connects,
 * sets the client order and performs one initial step. Any partial process
 * left by a failed attempt is killed before the next attempt starts.
 */
class EngineSimControl : public SimControl {
public:
    static constexpr int STARTUP_ATTEMPTS = 10;

    EngineSimControl(std::unique_ptr<ProcessSupervisor> supervisor, std::unique_ptr<ProtocolConnector> connector);
    ~EngineSimControl() override;

    EngineSimControl(const EngineSimControl&) = delete;
    EngineSimControl& operator=(const EngineSimControl&) = delete;

    ConnectionHandle start(const SimulationConfig& config) override;
    void pass_connection(const ConnectionHandle& connection) override;
    void step() override;
    void update(bool reset) override;
    bool check_collision() const override;
    void close() override;

    SimControlState get_state() const override { return state_; }

    const ProcessHandle& get_process() const { return process_; }

private:
    // Outcome of one startup attempt: a session, or the error that ended the attempt.
    struct AttemptResult {
        std::shared_ptr<Connection> connection;
        std::exception_ptr error;
    };

    AttemptResult try_start(const SimulationConfig& config, const EngineCommand& command, int attempt);

    void ensure_running(const char* operation) const;

    std::unique_ptr<ProcessSupervisor> supervisor_;
    std::unique_ptr<ProtocolConnector> connector_;

    SimControlState state_ = SimControlState::IDLE;
    ProcessHandle process_;
    std::shared_ptr<Connection> connection_;
};

}  // namespace flow::kernel
