/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/process/engine_process_supervisor.hpp"

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <thread>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "logger.hpp"

namespace flow::kernel {

EngineProcessSupervisor::EngineProcessSupervisor(std::chrono::milliseconds termination_grace) :
    termination_grace_(termination_grace) {}

ProcessHandle EngineProcessSupervisor::spawn(const std::string& command, const std::vector<std::string>& args) {
    // Bare names are resolved through PATH by posix_spawnp; explicit paths are checked up front.
    if (command.find('/') != std::string::npos && !std::filesystem::exists(command)) {
        FLOW_THROW_AS(SpawnError, "Engine binary not found at: {}", command);
    }

    std::vector<std::string> arg_strings;
    arg_strings.reserve(args.size() + 1);
    arg_strings.push_back(command);
    arg_strings.insert(arg_strings.end(), args.begin(), args.end());

    // Convert to char* array for posix_spawn
    std::vector<char*> argv;
    for (auto& arg : arg_strings) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // A new process group lets kill() reach the engine and anything it forks.
    posix_spawnattr_t attributes;
    posix_spawnattr_init(&attributes);
    posix_spawnattr_setflags(&attributes, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attributes, 0);

    pid_t pid = -1;
    int result = posix_spawnp(&pid, command.c_str(), nullptr, &attributes, argv.data(), environ);

    posix_spawnattr_destroy(&attributes);

    if (result != 0) {
        FLOW_THROW_AS(SpawnError, "Failed to spawn engine process {}: {}", command, strerror(result));
    }

    FLOW_INFO("Engine process spawned with PID: {}", pid);
    return ProcessHandle{pid, pid};
}

void EngineProcessSupervisor::kill(const ProcessHandle& handle) noexcept {
    try {
        if (!handle.is_valid()) {
            FLOW_DEBUG("No engine process to terminate");
            return;
        }

        const pid_t group = handle.pgid > 0 ? handle.pgid : handle.pid;
        if (::kill(-group, SIGTERM) != 0) {
            int error = errno;
            if (error == ESRCH) {
                FLOW_DEBUG("Engine process group {} is already gone", group);
            } else {
                FLOW_WARN("Failed to signal engine process group {}: {}", group, strerror(error));
            }
        }

        if (wait_for_exit(handle.pid)) {
            FLOW_DEBUG("Engine process {} terminated", handle.pid);
            return;
        }

        FLOW_WARN(
            "Engine process {} still running {} ms after SIGTERM, sending SIGKILL",
            handle.pid,
            termination_grace_.count());
        ::kill(-group, SIGKILL);
        int status;
        waitpid(handle.pid, &status, 0);
    } catch (const std::exception& e) {
        FLOW_ERROR("Error during engine teardown: {}", e.what());
    }
}

bool EngineProcessSupervisor::wait_for_exit(pid_t pid) const {
    const auto deadline = std::chrono::steady_clock::now() + termination_grace_;
    while (true) {
        int status;
        pid_t result = waitpid(pid, &status, WNOHANG);
        if (result == pid) {
            return true;
        }
        if (result == -1) {
            // ECHILD: reaped elsewhere or not our child, nothing left to wait for.
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(timeout::ENGINE_REAP_POLL_INTERVAL);
    }
}

bool EngineProcessSupervisor::is_alive(const ProcessHandle& handle) const {
    if (!handle.is_valid()) {
        return false;
    }

    if (::kill(handle.pid, 0) != 0) {
        int error = errno;
        if (error == ESRCH) {
            FLOW_DEBUG("Engine process {} is dead (ESRCH)", handle.pid);
            return false;
        }
        FLOW_DEBUG("Cannot check engine process {} status: {} - assuming alive", handle.pid, strerror(error));
        return true;
    }

    // Process exists, but an exited child stays a zombie until reaped.
    std::string stat_path = "/proc/" + std::to_string(handle.pid) + "/stat";
    std::ifstream stat_file(stat_path);
    if (!stat_file.is_open()) {
        return true;
    }

    std::string line;
    if (std::getline(stat_file, line)) {
        // Format: PID (comm) state ...
        size_t paren_pos = line.rfind(')');
        if (paren_pos != std::string::npos && paren_pos + 2 < line.length()) {
            char state = line[paren_pos + 2];
            if (state == 'Z') {
                FLOW_DEBUG("Engine process {} is a zombie", handle.pid);
                return false;
            }
            return true;
        }
    }

    FLOW_WARN("Cannot parse state of engine process {}, assuming dead", handle.pid);
    return false;
}

}  // namespace flow::kernel
