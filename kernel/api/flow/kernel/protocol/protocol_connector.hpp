/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "flow/kernel/protocol/connection.hpp"
#include "flow/kernel/utils/timeouts.hpp"

namespace flow::kernel {

// Opens control-protocol sessions. Separate from Connection so startup can be tested without an engine.
class ProtocolConnector {
public:
    virtual ~ProtocolConnector() = default;

    /**
     * Tries up to max_attempts times to open a session on the given port and
     * complete the handshake. Throws ConnectError once every attempt failed.
     */
    virtual std::shared_ptr<Connection> connect(int port, int max_attempts) = 0;
};

class EngineConnector : public ProtocolConnector {
public:
    explicit EngineConnector(
        std::string host = "localhost", std::chrono::milliseconds retry_delay = timeout::CONNECT_RETRY_DELAY);

    std::shared_ptr<Connection> connect(int port, int max_attempts) override;

private:
    std::string host_;
    std::chrono::milliseconds retry_delay_;
};

}  // namespace flow::kernel
