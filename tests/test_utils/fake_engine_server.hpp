// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include "flow/kernel/protocol/connection.hpp"
#include "flow/kernel/protocol/storage.hpp"
#include "flow/kernel/protocol/value.hpp"
#include "flow_asio.hpp"

namespace flow::kernel::test {

/**
 * Minimal engine speaking the control protocol on a loopback port.
 *
 * Serves one session at a time on a background thread. Values returned by
 * get and subscription responses come from set_value(); variables without a
 * value are reported with an error status.
 */
class FakeEngineServer {
public:
    FakeEngineServer();
    ~FakeEngineServer();

    FakeEngineServer(const FakeEngineServer&) = delete;
    FakeEngineServer& operator=(const FakeEngineServer&) = delete;

    int get_port() const { return port_; }

    void set_value(Domain domain, const std::string& object_id, uint8_t variable, protocol::Value value);

    // Makes the next command with this id answer with an error status.
    void fail_next(uint8_t command_id);

    int get_sessions() const { return sessions_.load(); }
    int get_steps() const { return steps_.load(); }
    int get_client_order() const { return client_order_.load(); }
    bool received_close() const { return received_close_.load(); }
    std::vector<uint8_t> get_commands() const;

    void stop();

private:
    struct Subscription {
        Domain domain;
        std::string object_id;
        std::vector<uint8_t> variables;
    };

    void run();
    void serve(asio::ip::tcp::socket& socket);
    // Returns false once the client closed the session.
    bool handle_command(uint8_t command_id, protocol::Storage& in, protocol::Storage& out);
    void append_subscription_response(protocol::Storage& out, const Subscription& subscription);

    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    int port_ = 0;

    mutable std::mutex mutex_;
    std::map<std::tuple<Domain, std::string, uint8_t>, protocol::Value> values_;
    std::vector<Subscription> subscriptions_;
    std::vector<uint8_t> commands_;
    std::vector<uint8_t> failing_commands_;

    std::atomic<int> sessions_{0};
    std::atomic<int> steps_{0};
    std::atomic<int> client_order_{-1};
    std::atomic<bool> received_close_{false};
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

}  // namespace flow::kernel::test
