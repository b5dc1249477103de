/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <sys/types.h>

#include <string>
#include <vector>

namespace flow::kernel {

// OS identity of a spawned engine. Only the supervisor that created it may act on it.
struct ProcessHandle {
    pid_t pid = -1;
    pid_t pgid = -1;

    bool is_valid() const { return pid > 0; }
};

/**
 * Launches the engine in a process group of its own and terminates that group.
 *
 * Implementations must keep kill() non-throwing: it runs between startup
 * attempts and during teardown, where a failure must never stop cleanup.
 */
class ProcessSupervisor {
public:
    virtual ~ProcessSupervisor() = default;

    // Throws SpawnError if the binary cannot be found or the OS refuses to create the process.
    virtual ProcessHandle spawn(const std::string& command, const std::vector<std::string>& args) = 0;

    // Terminates the whole process group. An invalid or already dead handle is logged and ignored.
    virtual void kill(const ProcessHandle& handle) noexcept = 0;

    virtual bool is_alive(const ProcessHandle& handle) const = 0;
};

}  // namespace flow::kernel
