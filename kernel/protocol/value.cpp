/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/protocol/value.hpp"

#include <type_traits>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"

namespace flow::kernel::protocol {

Value read_typed_value(Storage& in) {
    uint8_t type = in.read_unsigned_byte();
    switch (type) {
        case TYPE_UBYTE:
            return in.read_unsigned_byte();
        case TYPE_BYTE:
            return static_cast<int32_t>(in.read_byte());
        case TYPE_INTEGER:
            return in.read_int();
        case TYPE_DOUBLE:
            return in.read_double();
        case TYPE_STRING:
            return in.read_string();
        case TYPE_STRINGLIST:
            return in.read_string_list();
        case POSITION_2D: {
            Position2D position;
            position.x = in.read_double();
            position.y = in.read_double();
            return position;
        }
        default:
            FLOW_THROW_AS(ProtocolError, "Unsupported value type {}", static_cast<int>(type));
    }
}

void write_typed_value(Storage& out, const Value& value) {
    std::visit(
        [&out](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                FLOW_THROW_AS(ProtocolError, "Cannot encode an empty value");
            } else if constexpr (std::is_same_v<T, uint8_t>) {
                out.write_unsigned_byte(TYPE_UBYTE);
                out.write_unsigned_byte(v);
            } else if constexpr (std::is_same_v<T, int32_t>) {
                out.write_unsigned_byte(TYPE_INTEGER);
                out.write_int(v);
            } else if constexpr (std::is_same_v<T, double>) {
                out.write_unsigned_byte(TYPE_DOUBLE);
                out.write_double(v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                out.write_unsigned_byte(TYPE_STRING);
                out.write_string(v);
            } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
                out.write_unsigned_byte(TYPE_STRINGLIST);
                out.write_string_list(v);
            } else if constexpr (std::is_same_v<T, Position2D>) {
                out.write_unsigned_byte(POSITION_2D);
                out.write_double(v.x);
                out.write_double(v.y);
            }
        },
        value);
}

std::optional<double> value_as_double(const Value& value) {
    if (const auto* d = std::get_if<double>(&value)) {
        return *d;
    }
    if (const auto* i = std::get_if<int32_t>(&value)) {
        return static_cast<double>(*i);
    }
    if (const auto* b = std::get_if<uint8_t>(&value)) {
        return static_cast<double>(*b);
    }
    return std::nullopt;
}

const std::vector<std::string>* value_as_string_list(const Value& value) {
    return std::get_if<std::vector<std::string>>(&value);
}

const std::string* value_as_string(const Value& value) { return std::get_if<std::string>(&value); }

}  // namespace flow::kernel::protocol
