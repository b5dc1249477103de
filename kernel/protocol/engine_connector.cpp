/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include <thread>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/engine_connection.hpp"
#include "flow/kernel/protocol/protocol_connector.hpp"
#include "logger.hpp"

namespace flow::kernel {

EngineConnector::EngineConnector(std::string host, std::chrono::milliseconds retry_delay) :
    host_(std::move(host)), retry_delay_(retry_delay) {}

std::shared_ptr<Connection> EngineConnector::connect(int port, int max_attempts) {
    FLOW_ASSERT(max_attempts >= 1, "At least one connect attempt is required, got {}", max_attempts);

    std::string last_error;
    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        try {
            auto connection = std::make_shared<EngineConnection>(host_, port);
            EngineVersion version = connection->get_version();
            FLOW_INFO(
                "Connected to engine at {}:{} (API version {}, {}){}",
                host_,
                port,
                version.api_version,
                version.identifier,
                attempt > 1 ? fmt::format(" after {} attempts", attempt) : std::string());
            return connection;
        } catch (const KernelError& e) {
            last_error = e.what();
            FLOW_DEBUG("Connect attempt {}/{} to {}:{} failed: {}", attempt, max_attempts, host_, port, e.what());
        }

        if (attempt < max_attempts) {
            std::this_thread::sleep_for(retry_delay_);
        }
    }

    FLOW_THROW_AS(
        ConnectError,
        "Could not connect to engine at {}:{} after {} attempts. Last error: {}",
        host_,
        port,
        max_attempts,
        last_error);
}

}  // namespace flow::kernel
