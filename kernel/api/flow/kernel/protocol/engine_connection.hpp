/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string>
#include <vector>

#include "flow/kernel/protocol/connection.hpp"
#include "flow/kernel/protocol/storage.hpp"
#include "flow_asio.hpp"

namespace flow::kernel {

// Connection speaking the engine protocol over a TCP socket.
class EngineConnection : public Connection {
public:
    // Connects synchronously; throws ConnectError if the engine does not accept the session.
    EngineConnection(const std::string& host, int port);
    ~EngineConnection() override;

    EngineConnection(const EngineConnection&) = delete;
    EngineConnection& operator=(const EngineConnection&) = delete;

    EngineVersion get_version() override;
    void set_order(int order) override;
    void subscribe(Domain domain, const std::string& object_id, const std::vector<uint8_t>& variables) override;
    protocol::Value get_variable(Domain domain, uint8_t variable, const std::string& object_id) override;
    const protocol::SubscriptionResults& get_subscription_results(Domain domain) const override;
    void simulation_step() override;
    void close() override;
    bool is_closed() const override { return closed_; }

private:
    // Sends one command, checks its status and returns the response positioned just after the status.
    protocol::Storage exchange(uint8_t command_id, const protocol::Storage& content);

    void send_message(const std::vector<uint8_t>& bytes);
    protocol::Storage receive_message();

    void read_subscription_response(protocol::Storage& in);

    void close_socket() noexcept;

    asio::io_context io_context_;
    asio::ip::tcp::socket socket_;

    std::string endpoint_name_;
    std::array<protocol::SubscriptionResults, 3> subscription_results_;
    bool closed_ = false;
};

}  // namespace flow::kernel
