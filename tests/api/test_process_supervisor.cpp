// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/process/engine_process_supervisor.hpp"

using namespace flow::kernel;

TEST(EngineProcessSupervisor, SpawnsIntoOwnProcessGroup) {
    EngineProcessSupervisor supervisor;
    ProcessHandle handle = supervisor.spawn("sleep", {"30"});

    ASSERT_TRUE(handle.is_valid());
    EXPECT_EQ(handle.pgid, handle.pid);
    EXPECT_EQ(getpgid(handle.pid), handle.pid);
    EXPECT_TRUE(supervisor.is_alive(handle));

    supervisor.kill(handle);
    EXPECT_FALSE(supervisor.is_alive(handle));
}

TEST(EngineProcessSupervisor, KillReachesGrandchildren) {
    std::filesystem::path pid_file = std::filesystem::temp_directory_path() / "flow_kernel_grandchild.pid";
    std::filesystem::remove(pid_file);

    EngineProcessSupervisor supervisor;
    // The shell forks sleep and waits for it; both share the engine's process group.
    ProcessHandle handle =
        supervisor.spawn("/bin/sh", {"-c", "sleep 30 & echo $! > " + pid_file.string() + "; wait"});

    pid_t grandchild = -1;
    for (int i = 0; i < 100 && grandchild <= 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        std::ifstream file(pid_file);
        file >> grandchild;
    }
    ASSERT_GT(grandchild, 0);
    ProcessHandle grandchild_handle{grandchild, handle.pgid};
    EXPECT_TRUE(supervisor.is_alive(grandchild_handle));

    supervisor.kill(handle);

    EXPECT_FALSE(supervisor.is_alive(handle));
    for (int i = 0; i < 100 && supervisor.is_alive(grandchild_handle); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_FALSE(supervisor.is_alive(grandchild_handle));
    std::filesystem::remove(pid_file);
}

TEST(EngineProcessSupervisor, EscalatesToSigkill) {
    EngineProcessSupervisor supervisor(std::chrono::milliseconds(200));
    ProcessHandle handle = supervisor.spawn("/bin/sh", {"-c", "trap '' TERM; while true; do sleep 0.05; done"});
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto start = std::chrono::steady_clock::now();
    supervisor.kill(handle);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(supervisor.is_alive(handle));
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
}

TEST(EngineProcessSupervisor, ExitedChildIsNotAlive) {
    EngineProcessSupervisor supervisor;
    ProcessHandle handle = supervisor.spawn("true", {});
    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    // Exited but not yet reaped: a zombie counts as dead.
    EXPECT_FALSE(supervisor.is_alive(handle));
    supervisor.kill(handle);
}

TEST(EngineProcessSupervisor, MissingBinary) {
    EngineProcessSupervisor supervisor;
    EXPECT_THROW(supervisor.spawn("/nonexistent/engine-binary", {}), SpawnError);
    EXPECT_THROW(supervisor.spawn("flow-kernel-no-such-engine", {}), SpawnError);
}

TEST(EngineProcessSupervisor, KillIsSafeOnInvalidAndDeadHandles) {
    EngineProcessSupervisor supervisor;
    EXPECT_NO_THROW(supervisor.kill(ProcessHandle{}));
    EXPECT_FALSE(supervisor.is_alive(ProcessHandle{}));

    ProcessHandle handle = supervisor.spawn("true", {});
    supervisor.kill(handle);
    EXPECT_NO_THROW(supervisor.kill(handle));
}
