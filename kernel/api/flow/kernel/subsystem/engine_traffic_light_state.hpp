/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "flow/kernel/subsystem/kernel_subsystem.hpp"

namespace flow::kernel {

// Follows the signal state of every traffic light the engine knows about.
class EngineTrafficLightState : public TrafficLightState {
public:
    void pass_connection(const ConnectionHandle& connection) override;
    void update(bool reset) override;

    std::vector<std::string> get_ids() const override { return ids_; }
    std::string get_state(const std::string& traffic_light_id) const override;

private:
    ConnectionHandle connection_;
    std::vector<std::string> ids_;
    std::map<std::string, std::string> states_;
};

}  // namespace flow::kernel
