/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/protocol/engine_connection.hpp"

#include <fmt/format.h>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/message.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"
#include "logger.hpp"

namespace flow::kernel {

using namespace protocol;

namespace {

size_t domain_index(Domain domain) { return static_cast<size_t>(domain); }

uint8_t get_command_for(Domain domain) {
    switch (domain) {
        case Domain::VEHICLE:
            return CMD_GET_VEHICLE_VARIABLE;
        case Domain::TRAFFIC_LIGHT:
            return CMD_GET_TL_VARIABLE;
        case Domain::SIMULATION:
            return CMD_GET_SIM_VARIABLE;
    }
    FLOW_THROW("Unknown domain {}", static_cast<int>(domain));
}

uint8_t subscribe_command_for(Domain domain) {
    switch (domain) {
        case Domain::VEHICLE:
            return CMD_SUBSCRIBE_VEHICLE_VARIABLE;
        case Domain::TRAFFIC_LIGHT:
            return CMD_SUBSCRIBE_TL_VARIABLE;
        case Domain::SIMULATION:
            return CMD_SUBSCRIBE_SIM_VARIABLE;
    }
    FLOW_THROW("Unknown domain {}", static_cast<int>(domain));
}

Domain domain_for_subscription_response(uint8_t response_id) {
    switch (response_id) {
        case RESPONSE_SUBSCRIBE_VEHICLE_VARIABLE:
            return Domain::VEHICLE;
        case RESPONSE_SUBSCRIBE_TL_VARIABLE:
            return Domain::TRAFFIC_LIGHT;
        case RESPONSE_SUBSCRIBE_SIM_VARIABLE:
            return Domain::SIMULATION;
    }
    FLOW_THROW_AS(ProtocolError, "Unexpected subscription response {}", static_cast<int>(response_id));
}

}  // namespace

EngineConnection::EngineConnection(const std::string& host, int port) :
    socket_(io_context_), endpoint_name_(fmt::format("{}:{}", host, port)) {
    error_code ec;
    asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        FLOW_THROW_AS(ConnectError, "Cannot resolve engine address {}: {}", endpoint_name_, ec.message());
    }

    asio::connect(socket_, endpoints, ec);
    if (ec) {
        FLOW_THROW_AS(ConnectError, "Could not connect to engine at {}: {}", endpoint_name_, ec.message());
    }

    // Every command is a small request awaiting its answer; Nagle only adds latency.
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        FLOW_DEBUG("Failed to disable Nagle on {}: {}", endpoint_name_, ec.message());
    }
}

EngineConnection::~EngineConnection() { close_socket(); }

EngineVersion EngineConnection::get_version() {
    Storage response = exchange(CMD_GETVERSION, Storage{});
    CommandHeader header = read_command_header(response);
    if (header.id != CMD_GETVERSION) {
        FLOW_THROW_AS(ProtocolError, "Expected version response, got command {}", static_cast<int>(header.id));
    }
    EngineVersion version;
    version.api_version = response.read_int();
    version.identifier = response.read_string();
    return version;
}

void EngineConnection::set_order(int order) {
    Storage content;
    content.write_int(order);
    exchange(CMD_SETORDER, content);
}

void EngineConnection::subscribe(Domain domain, const std::string& object_id, const std::vector<uint8_t>& variables) {
    FLOW_ASSERT(variables.size() <= 255, "Cannot subscribe to {} variables at once", variables.size());

    Storage content;
    content.write_double(INVALID_DOUBLE_VALUE);
    content.write_double(INVALID_DOUBLE_VALUE);
    content.write_string(object_id);
    content.write_unsigned_byte(static_cast<uint8_t>(variables.size()));
    for (uint8_t variable : variables) {
        content.write_unsigned_byte(variable);
    }

    Storage response = exchange(subscribe_command_for(domain), content);
    // Unsubscribing (empty variable list) is answered by the status alone.
    if (response.has_remaining()) {
        read_subscription_response(response);
    }
}

Value EngineConnection::get_variable(Domain domain, uint8_t variable, const std::string& object_id) {
    const uint8_t command_id = get_command_for(domain);

    Storage content;
    content.write_unsigned_byte(variable);
    content.write_string(object_id);

    Storage response = exchange(command_id, content);
    CommandHeader header = read_command_header(response);
    if (header.id != command_id + RESPONSE_OFFSET) {
        FLOW_THROW_AS(
            ProtocolError,
            "Expected response {} to get command, got {}",
            command_id + RESPONSE_OFFSET,
            static_cast<int>(header.id));
    }
    uint8_t response_variable = response.read_unsigned_byte();
    std::string response_object = response.read_string();
    if (response_variable != variable || response_object != object_id) {
        FLOW_THROW_AS(
            ProtocolError,
            "Response for variable {} of '{}' answers variable {} of '{}'",
            static_cast<int>(variable),
            object_id,
            static_cast<int>(response_variable),
            response_object);
    }
    Value value = read_typed_value(response);
    response.seek(header.end_position);
    return value;
}

const SubscriptionResults& EngineConnection::get_subscription_results(Domain domain) const {
    return subscription_results_[domain_index(domain)];
}

void EngineConnection::simulation_step() {
    Storage content;
    // Target time 0 advances by exactly one configured step.
    content.write_double(0.0);
    Storage response = exchange(CMD_SIMSTEP, content);

    for (auto& results : subscription_results_) {
        results.clear();
    }

    int32_t count = response.read_int();
    for (int32_t i = 0; i < count; ++i) {
        read_subscription_response(response);
    }
}

void EngineConnection::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    try {
        exchange(CMD_CLOSE, Storage{});
    } catch (const KernelError&) {
        close_socket();
        throw;
    }
    close_socket();
    FLOW_DEBUG("Closed engine session {}", endpoint_name_);
}

Storage EngineConnection::exchange(uint8_t command_id, const Storage& content) {
    if (closed_ && command_id != CMD_CLOSE) {
        FLOW_THROW_AS(ProtocolError, "Engine session {} is closed", endpoint_name_);
    }

    Storage body;
    append_command(body, command_id, content);
    send_message(frame_message(body));

    Storage response = receive_message();
    StatusResponse status = read_status(response);
    if (status.command_id != command_id) {
        FLOW_THROW_AS(
            ProtocolError,
            "Status answers command {} instead of {}",
            static_cast<int>(status.command_id),
            static_cast<int>(command_id));
    }
    if (!status.is_ok()) {
        FLOW_THROW_AS(
            ProtocolError,
            "Engine rejected command {} (status {}): {}",
            static_cast<int>(command_id),
            static_cast<int>(status.result),
            status.description);
    }
    return response;
}

void EngineConnection::send_message(const std::vector<uint8_t>& bytes) {
    error_code ec;
    asio::write(socket_, asio::buffer(bytes), ec);
    if (ec) {
        FLOW_THROW_AS(ProtocolError, "Failed to send message to engine {}: {}", endpoint_name_, ec.message());
    }
}

Storage EngineConnection::receive_message() {
    std::vector<uint8_t> header(MESSAGE_HEADER_SIZE);
    error_code ec;
    asio::read(socket_, asio::buffer(header), ec);
    if (ec) {
        FLOW_THROW_AS(ProtocolError, "Failed to read message header from engine {}: {}", endpoint_name_, ec.message());
    }

    Storage header_storage(header);
    int32_t total_length = header_storage.read_int();
    if (total_length < static_cast<int32_t>(MESSAGE_HEADER_SIZE)) {
        FLOW_THROW_AS(ProtocolError, "Invalid message length {} from engine {}", total_length, endpoint_name_);
    }

    std::vector<uint8_t> body(static_cast<size_t>(total_length) - MESSAGE_HEADER_SIZE);
    asio::read(socket_, asio::buffer(body), ec);
    if (ec) {
        FLOW_THROW_AS(ProtocolError, "Failed to read message body from engine {}: {}", endpoint_name_, ec.message());
    }
    return Storage(std::move(body));
}

void EngineConnection::read_subscription_response(Storage& in) {
    CommandHeader header = read_command_header(in);
    Domain domain = domain_for_subscription_response(header.id);
    std::string object_id = in.read_string();
    uint8_t count = in.read_unsigned_byte();

    VariableMap& values = subscription_results_[domain_index(domain)][object_id];
    for (uint8_t i = 0; i < count; ++i) {
        uint8_t variable = in.read_unsigned_byte();
        uint8_t status = in.read_unsigned_byte();
        Value value = read_typed_value(in);
        if (status == RTYPE_OK) {
            values[variable] = std::move(value);
        } else {
            const std::string* error = value_as_string(value);
            FLOW_WARN(
                "Engine could not report {} variable {} of '{}': {}",
                to_string(domain),
                static_cast<int>(variable),
                object_id,
                error != nullptr ? *error : std::string("unknown error"));
            values.erase(variable);
        }
    }
    in.seek(header.end_position);
}

void EngineConnection::close_socket() noexcept {
    error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

}  // namespace flow::kernel
