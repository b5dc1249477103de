/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "flow/kernel/process/process_supervisor.hpp"
#include "flow/kernel/utils/timeouts.hpp"

namespace flow::kernel {

// POSIX supervisor: posix_spawn into a new process group, SIGTERM then SIGKILL to the group.
class EngineProcessSupervisor : public ProcessSupervisor {
public:
    explicit EngineProcessSupervisor(
        std::chrono::milliseconds termination_grace = timeout::ENGINE_TERMINATION_GRACE);

    ProcessHandle spawn(const std::string& command, const std::vector<std::string>& args) override;
    void kill(const ProcessHandle& handle) noexcept override;
    bool is_alive(const ProcessHandle& handle) const override;

private:
    // Waits for the direct child to exit, up to the grace period. Returns true once it has been reaped.
    bool wait_for_exit(pid_t pid) const;

    std::chrono::milliseconds termination_grace_;
};

}  // namespace flow::kernel
