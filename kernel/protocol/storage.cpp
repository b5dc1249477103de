/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/protocol/storage.hpp"

#include <algorithm>
#include <cstring>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"

namespace flow::kernel::protocol {

Storage::Storage(std::vector<uint8_t> data) : data_(std::move(data)) {}

void Storage::write_unsigned_byte(uint8_t value) { data_.push_back(value); }

void Storage::write_byte(int8_t value) { data_.push_back(static_cast<uint8_t>(value)); }

void Storage::write_int(int32_t value) {
    uint32_t bits = static_cast<uint32_t>(value);
    for (int shift = 24; shift >= 0; shift -= 8) {
        data_.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
    }
}

void Storage::write_double(double value) {
    static_assert(sizeof(double) == sizeof(uint64_t), "Wire doubles are 8 bytes");
    uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    for (int shift = 56; shift >= 0; shift -= 8) {
        data_.push_back(static_cast<uint8_t>((bits >> shift) & 0xFF));
    }
}

void Storage::write_string(const std::string& value) {
    write_int(static_cast<int32_t>(value.size()));
    data_.insert(data_.end(), value.begin(), value.end());
}

void Storage::write_string_list(const std::vector<std::string>& values) {
    write_int(static_cast<int32_t>(values.size()));
    for (const auto& value : values) {
        write_string(value);
    }
}

void Storage::write_storage(const Storage& other) { data_.insert(data_.end(), other.data_.begin(), other.data_.end()); }

uint8_t Storage::read_unsigned_byte() {
    ensure_available(1);
    return data_[position_++];
}

int8_t Storage::read_byte() { return static_cast<int8_t>(read_unsigned_byte()); }

int32_t Storage::read_int() {
    ensure_available(4);
    uint32_t bits = 0;
    for (int i = 0; i < 4; ++i) {
        bits = (bits << 8) | data_[position_++];
    }
    return static_cast<int32_t>(bits);
}

double Storage::read_double() {
    ensure_available(8);
    uint64_t bits = 0;
    for (int i = 0; i < 8; ++i) {
        bits = (bits << 8) | data_[position_++];
    }
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string Storage::read_string() {
    int32_t length = read_int();
    if (length < 0) {
        FLOW_THROW_AS(ProtocolError, "Negative string length {}", length);
    }
    ensure_available(static_cast<size_t>(length));
    std::string value(data_.begin() + position_, data_.begin() + position_ + length);
    position_ += length;
    return value;
}

std::vector<std::string> Storage::read_string_list() {
    int32_t count = read_int();
    if (count < 0) {
        FLOW_THROW_AS(ProtocolError, "Negative string list size {}", count);
    }
    std::vector<std::string> values;
    values.reserve(std::min<size_t>(count, remaining() / 4));
    for (int32_t i = 0; i < count; ++i) {
        values.push_back(read_string());
    }
    return values;
}

void Storage::seek(size_t position) {
    if (position > data_.size()) {
        FLOW_THROW_AS(ProtocolError, "Cannot seek to {} in a buffer of {} bytes", position, data_.size());
    }
    position_ = position;
}

void Storage::ensure_available(size_t count) const {
    if (count > remaining()) {
        FLOW_THROW_AS(
            ProtocolError, "Read of {} bytes at offset {} overruns buffer of {} bytes", count, position_, data_.size());
    }
}

}  // namespace flow::kernel::protocol
