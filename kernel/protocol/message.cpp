/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/protocol/message.hpp"

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"

namespace flow::kernel::protocol {

void append_command(Storage& body, uint8_t command_id, const Storage& content) {
    // Length counts the length field(s) and the command id.
    const size_t short_length = content.size() + 2;
    if (short_length <= 255) {
        body.write_unsigned_byte(static_cast<uint8_t>(short_length));
    } else {
        body.write_unsigned_byte(0);
        body.write_int(static_cast<int32_t>(content.size() + 6));
    }
    body.write_unsigned_byte(command_id);
    body.write_storage(content);
}

std::vector<uint8_t> frame_message(const Storage& body) {
    Storage message;
    message.write_int(static_cast<int32_t>(body.size() + MESSAGE_HEADER_SIZE));
    message.write_storage(body);
    return message.data();
}

CommandHeader read_command_header(Storage& in) {
    const size_t start = in.position();
    size_t length = in.read_unsigned_byte();
    if (length == 0) {
        int32_t extended_length = in.read_int();
        if (extended_length < 6) {
            FLOW_THROW_AS(ProtocolError, "Invalid extended command length {}", extended_length);
        }
        length = static_cast<size_t>(extended_length);
    } else if (length < 2) {
        FLOW_THROW_AS(ProtocolError, "Invalid command length {}", length);
    }

    CommandHeader header;
    header.id = in.read_unsigned_byte();
    header.end_position = start + length;
    if (header.end_position > in.size()) {
        FLOW_THROW_AS(
            ProtocolError,
            "Command {} claims {} bytes but only {} remain",
            static_cast<int>(header.id),
            length,
            in.size() - start);
    }
    return header;
}

bool StatusResponse::is_ok() const { return result == RTYPE_OK; }

StatusResponse read_status(Storage& in) {
    CommandHeader header = read_command_header(in);
    StatusResponse status;
    status.command_id = header.id;
    status.result = in.read_unsigned_byte();
    status.description = in.read_string();
    in.seek(header.end_position);
    return status;
}

void append_status(Storage& body, uint8_t command_id, uint8_t result, const std::string& description) {
    Storage content;
    content.write_unsigned_byte(result);
    content.write_string(description);
    append_command(body, command_id, content);
}

}  // namespace flow::kernel::protocol
