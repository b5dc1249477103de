/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>

#include "flow/kernel/subsystem/kernel_subsystem.hpp"

namespace flow::kernel {

/**
 * Tracks the vehicles currently in the network.
 *
 * Relies on the simulation-level departed/arrived subscription set up by the
 * simulation control. Each departing vehicle is subscribed to its
 * kinematics; arrived vehicles are dropped.
 */
class EngineVehicleState : public VehicleState {
public:
    void pass_connection(const ConnectionHandle& connection) override;
    void update(bool reset) override;

    std::vector<std::string> get_ids() const override;
    size_t get_num_vehicles() const override { return vehicles_.size(); }
    const std::vector<std::string>& get_departed_ids() const override { return departed_ids_; }
    const std::vector<std::string>& get_arrived_ids() const override { return arrived_ids_; }

    double get_speed(const std::string& vehicle_id) const override;
    protocol::Position2D get_position(const std::string& vehicle_id) const override;
    std::string get_edge(const std::string& vehicle_id) const override;
    int get_lane(const std::string& vehicle_id) const override;
    double get_lane_position(const std::string& vehicle_id) const override;
    std::string get_route(const std::string& vehicle_id) const override;

private:
    void add_vehicle(const std::string& vehicle_id);
    void resynchronise();
    const protocol::Value& get_value(const std::string& vehicle_id, uint8_t variable) const;

    ConnectionHandle connection_;
    // Vehicle id -> variables delivered by the last step.
    std::map<std::string, protocol::VariableMap> vehicles_;
    std::vector<std::string> departed_ids_;
    std::vector<std::string> arrived_ids_;
};

}  // namespace flow::kernel
