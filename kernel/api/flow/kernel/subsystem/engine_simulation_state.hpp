/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "flow/kernel/subsystem/kernel_subsystem.hpp"

namespace flow::kernel {

// Simulation clock as reported by the engine's simulation-level subscription.
class EngineSimulationState : public SimulationState {
public:
    void pass_connection(const ConnectionHandle& connection) override;
    void update(bool reset) override;

    double get_time() const override { return time_; }
    double get_step_length() const override { return step_length_; }
    int get_step_count() const override { return step_count_; }

    void close() override;

private:
    ConnectionHandle connection_;
    double time_ = 0;
    double step_length_ = 0;
    int step_count_ = 0;
};

}  // namespace flow::kernel
