/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/protocol/connection.hpp"

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"

namespace flow::kernel {

std::string to_string(Domain domain) {
    switch (domain) {
        case Domain::VEHICLE:
            return "vehicle";
        case Domain::TRAFFIC_LIGHT:
            return "traffic_light";
        case Domain::SIMULATION:
            return "simulation";
    }
    return "unknown";
}

ConnectionHandle::ConnectionHandle(std::shared_ptr<Connection> connection) : connection_(std::move(connection)) {}

void ConnectionHandle::subscribe(
    Domain domain, const std::string& object_id, const std::vector<uint8_t>& variables) const {
    get().subscribe(domain, object_id, variables);
}

protocol::Value ConnectionHandle::get_variable(Domain domain, uint8_t variable, const std::string& object_id) const {
    return get().get_variable(domain, variable, object_id);
}

const protocol::SubscriptionResults& ConnectionHandle::get_subscription_results(Domain domain) const {
    return get().get_subscription_results(domain);
}

const protocol::VariableMap* ConnectionHandle::get_simulation_values() const {
    const protocol::SubscriptionResults& results = get_subscription_results(Domain::SIMULATION);
    auto it = results.find("");
    return it == results.end() ? nullptr : &it->second;
}

bool ConnectionHandle::is_closed() const { return connection_ == nullptr || connection_->is_closed(); }

Connection& ConnectionHandle::get() const {
    if (connection_ == nullptr) {
        FLOW_THROW_AS(NotStartedError, "Connection handle is empty; the simulation has not been started");
    }
    return *connection_;
}

}  // namespace flow::kernel
