// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

// In-memory Connection for tests that do not need a socket.

#pragma once

#include <array>
#include <functional>
#include <map>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/connection.hpp"

namespace flow::kernel::test {

struct SubscribeCall {
    Domain domain;
    std::string object_id;
    std::vector<uint8_t> variables;
};

class FakeConnection : public Connection {
public:
    EngineVersion get_version() override { return EngineVersion{21, "FakeConnection"}; }

    void set_order(int order) override {
        if (fail_set_order) {
            throw ProtocolError("set_order rejected");
        }
        this->order = order;
    }

    void subscribe(Domain domain, const std::string& object_id, const std::vector<uint8_t>& variables) override {
        subscriptions.push_back(SubscribeCall{domain, object_id, variables});
    }

    protocol::Value get_variable(Domain domain, uint8_t variable, const std::string& object_id) override {
        auto it = variables.find(std::make_tuple(domain, variable, object_id));
        if (it == variables.end()) {
            throw ProtocolError("no such variable");
        }
        return it->second;
    }

    const protocol::SubscriptionResults& get_subscription_results(Domain domain) const override {
        return results[static_cast<size_t>(domain)];
    }

    void simulation_step() override {
        if (closed) {
            throw ProtocolError("session closed");
        }
        ++steps;
        if (on_step) {
            on_step(*this);
        }
    }

    void close() override {
        ++close_calls;
        closed = true;
    }

    bool is_closed() const override { return closed; }

    protocol::SubscriptionResults& results_for(Domain domain) { return results[static_cast<size_t>(domain)]; }

    void set_simulation_value(uint8_t variable, protocol::Value value) {
        results_for(Domain::SIMULATION)[""][variable] = std::move(value);
    }

    int order = -1;
    int steps = 0;
    int close_calls = 0;
    bool closed = false;
    bool fail_set_order = false;
    std::vector<SubscribeCall> subscriptions;
    std::map<std::tuple<Domain, uint8_t, std::string>, protocol::Value> variables;
    std::array<protocol::SubscriptionResults, 3> results;
    std::function<void(FakeConnection&)> on_step;
};

}  // namespace flow::kernel::test
