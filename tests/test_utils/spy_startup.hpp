// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

// Spy supervisor and scripted connector sharing one event log, for startup and teardown ordering tests.

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/process/process_supervisor.hpp"
#include "flow/kernel/protocol/protocol_connector.hpp"
#include "test_utils/fake_connection.hpp"

namespace flow::kernel::test {

struct StartupRecord {
    std::vector<std::string> events;
    int spawns = 0;
    int kills = 0;
    int connects = 0;
    std::vector<std::string> spawned_commands;
    std::vector<std::vector<std::string>> spawned_args;
    std::vector<ProcessHandle> killed_handles;
};

class SpyProcessSupervisor : public ProcessSupervisor {
public:
    explicit SpyProcessSupervisor(std::shared_ptr<StartupRecord> record) : record_(std::move(record)) {}

    ProcessHandle spawn(const std::string& command, const std::vector<std::string>& args) override {
        ++record_->spawns;
        record_->events.push_back("spawn");
        record_->spawned_commands.push_back(command);
        record_->spawned_args.push_back(args);
        if (fail_spawn && fail_spawn(record_->spawns)) {
            throw SpawnError("spawn refused on attempt " + std::to_string(record_->spawns));
        }
        pid_t pid = 1000 + record_->spawns;
        return ProcessHandle{pid, pid};
    }

    void kill(const ProcessHandle& handle) noexcept override {
        ++record_->kills;
        record_->events.push_back("kill");
        record_->killed_handles.push_back(handle);
    }

    bool is_alive(const ProcessHandle& handle) const override { return alive && handle.is_valid(); }

    // Attempt number (1-based) -> whether spawning fails.
    std::function<bool(int)> fail_spawn;
    bool alive = true;

private:
    std::shared_ptr<StartupRecord> record_;
};

class ScriptedConnector : public ProtocolConnector {
public:
    // Attempt number (1-based) -> connection. The script throws to make the attempt fail.
    using Script = std::function<std::shared_ptr<Connection>(int)>;

    ScriptedConnector(std::shared_ptr<StartupRecord> record, Script script) :
        record_(std::move(record)), script_(std::move(script)) {}

    std::shared_ptr<Connection> connect(int port, int max_attempts) override {
        ++record_->connects;
        record_->events.push_back("connect");
        last_port = port;
        last_max_attempts = max_attempts;
        return script_(record_->connects);
    }

    int last_port = 0;
    int last_max_attempts = 0;

private:
    std::shared_ptr<StartupRecord> record_;
    Script script_;
};

}  // namespace flow::kernel::test
