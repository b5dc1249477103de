/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "flow/kernel/protocol/connection.hpp"
#include "flow/kernel/protocol/value.hpp"

namespace flow::kernel {

/**
 * A cache of engine state refreshed once per step.
 *
 * pass_connection() is called once after the engine started; subsystems keep
 * the handle and issue their own subscriptions. update() runs after every
 * step. With reset set, the previous step reinitialised the simulation and
 * cached state must be rebuilt rather than diffed.
 */
class KernelSubsystem {
public:
    virtual ~KernelSubsystem() = default;

    virtual void pass_connection(const ConnectionHandle& connection) = 0;
    virtual void update(bool reset) = 0;
};

class VehicleState : public KernelSubsystem {
public:
    virtual std::vector<std::string> get_ids() const = 0;
    virtual size_t get_num_vehicles() const = 0;

    // Vehicles that entered or left the network during the last step.
    virtual const std::vector<std::string>& get_departed_ids() const = 0;
    virtual const std::vector<std::string>& get_arrived_ids() const = 0;

    virtual double get_speed(const std::string& vehicle_id) const = 0;
    virtual protocol::Position2D get_position(const std::string& vehicle_id) const = 0;
    virtual std::string get_edge(const std::string& vehicle_id) const = 0;
    virtual int get_lane(const std::string& vehicle_id) const = 0;
    virtual double get_lane_position(const std::string& vehicle_id) const = 0;
    virtual std::string get_route(const std::string& vehicle_id) const = 0;
};

class TrafficLightState : public KernelSubsystem {
public:
    virtual std::vector<std::string> get_ids() const = 0;

    // Red-yellow-green state string, one character per controlled link.
    virtual std::string get_state(const std::string& traffic_light_id) const = 0;
};

class SimulationState : public KernelSubsystem {
public:
    // Simulated time in seconds.
    virtual double get_time() const = 0;
    virtual double get_step_length() const = 0;
    // Steps since the last reset.
    virtual int get_step_count() const = 0;

    // Flushes final state while the session is still open. Called once, before the engine is stopped.
    virtual void close() = 0;
};

}  // namespace flow::kernel
