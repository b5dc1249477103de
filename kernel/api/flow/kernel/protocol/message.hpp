/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "flow/kernel/protocol/storage.hpp"

namespace flow::kernel::protocol {

// Size of the int32 total-length prefix of every message.
inline constexpr size_t MESSAGE_HEADER_SIZE = 4;

/**
 * Appends one command to a message body.
 *
 * Short commands use a one byte length; commands longer than 255 bytes are
 * written as a zero byte followed by an int32 length.
 */
void append_command(Storage& body, uint8_t command_id, const Storage& content);

// Prefixes a message body with its total length.
std::vector<uint8_t> frame_message(const Storage& body);

struct CommandHeader {
    uint8_t id = 0;
    // Position just past the command inside the storage it was read from.
    size_t end_position = 0;
};

CommandHeader read_command_header(Storage& in);

struct StatusResponse {
    uint8_t command_id = 0;
    uint8_t result = 0;
    std::string description;

    bool is_ok() const;
};

StatusResponse read_status(Storage& in);

void append_status(Storage& body, uint8_t command_id, uint8_t result, const std::string& description = "");

}  // namespace flow::kernel::protocol
