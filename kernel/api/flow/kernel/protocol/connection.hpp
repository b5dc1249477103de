/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "flow/kernel/protocol/value.hpp"

namespace flow::kernel {

enum class Domain : uint8_t {
    VEHICLE,
    TRAFFIC_LIGHT,
    SIMULATION,
};

std::string to_string(Domain domain);

struct EngineVersion {
    int32_t api_version = 0;
    std::string identifier;
};

/**
 * A live control-protocol session with one engine.
 *
 * Every call is a blocking request/response round trip. Subscriptions are
 * pull-based: after subscribe(), each simulation_step() refreshes the values
 * returned by get_subscription_results() without further requests.
 */
class Connection {
public:
    virtual ~Connection() = default;

    virtual EngineVersion get_version() = 0;

    // Position of this client when several clients drive the same engine.
    virtual void set_order(int order) = 0;

    virtual void subscribe(Domain domain, const std::string& object_id, const std::vector<uint8_t>& variables) = 0;

    virtual protocol::Value get_variable(Domain domain, uint8_t variable, const std::string& object_id) = 0;

    // Values delivered by the most recent step (or subscribe) for the domain.
    virtual const protocol::SubscriptionResults& get_subscription_results(Domain domain) const = 0;

    // Advances the engine by exactly one step length.
    virtual void simulation_step() = 0;

    // Ends the session. Calling it again is a no-op.
    virtual void close() = 0;

    virtual bool is_closed() const = 0;
};

/**
 * The view of a Connection handed to state subsystems.
 *
 * It shares ownership of the session but only exposes queries and
 * subscriptions; stepping and closing stay with the simulation control.
 */
class ConnectionHandle {
public:
    ConnectionHandle() = default;
    explicit ConnectionHandle(std::shared_ptr<Connection> connection);

    void subscribe(Domain domain, const std::string& object_id, const std::vector<uint8_t>& variables) const;
    protocol::Value get_variable(Domain domain, uint8_t variable, const std::string& object_id) const;
    const protocol::SubscriptionResults& get_subscription_results(Domain domain) const;

    // Convenience for the object-less simulation domain.
    const protocol::VariableMap* get_simulation_values() const;

    bool is_valid() const { return connection_ != nullptr; }
    bool is_closed() const;

private:
    Connection& get() const;

    std::shared_ptr<Connection> connection_;
};

}  // namespace flow::kernel
