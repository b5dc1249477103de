/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "flow/kernel/protocol/storage.hpp"

namespace flow::kernel::protocol {

struct Position2D {
    double x = 0;
    double y = 0;

    bool operator==(const Position2D& other) const { return x == other.x && y == other.y; }
};

// A variable value as carried on the wire. std::monostate marks "no value".
using Value = std::variant<std::monostate, uint8_t, int32_t, double, std::string, std::vector<std::string>, Position2D>;

// Variable id -> value, for one object.
using VariableMap = std::map<uint8_t, Value>;

// Object id -> its subscribed variables, for one domain.
using SubscriptionResults = std::unordered_map<std::string, VariableMap>;

// Reads a type byte followed by a value of that type. Unsupported types throw ProtocolError.
Value read_typed_value(Storage& in);

// Writes a type byte followed by the value. std::monostate cannot be written.
void write_typed_value(Storage& out, const Value& value);

// Numeric view of integer or double values; nullopt for anything else.
std::optional<double> value_as_double(const Value& value);

const std::vector<std::string>* value_as_string_list(const Value& value);

const std::string* value_as_string(const Value& value);

}  // namespace flow::kernel::protocol
