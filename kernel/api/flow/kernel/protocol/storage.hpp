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

namespace flow::kernel::protocol {

/**
 * Byte buffer with a read cursor, encoding values the way the engine expects:
 * big-endian integers and IEEE-754 doubles, strings as int32 length + bytes,
 * string lists as int32 count + strings.
 *
 * Reads past the end throw ProtocolError instead of returning garbage.
 */
class Storage {
public:
    Storage() = default;
    explicit Storage(std::vector<uint8_t> data);

    void write_unsigned_byte(uint8_t value);
    void write_byte(int8_t value);
    void write_int(int32_t value);
    void write_double(double value);
    void write_string(const std::string& value);
    void write_string_list(const std::vector<std::string>& values);
    void write_storage(const Storage& other);

    uint8_t read_unsigned_byte();
    int8_t read_byte();
    int32_t read_int();
    double read_double();
    std::string read_string();
    std::vector<std::string> read_string_list();

    size_t size() const { return data_.size(); }
    size_t position() const { return position_; }
    size_t remaining() const { return data_.size() - position_; }
    bool has_remaining() const { return position_ < data_.size(); }

    // Moves the read cursor; throws ProtocolError if the target lies beyond the buffer.
    void seek(size_t position);

    const std::vector<uint8_t>& data() const { return data_; }

private:
    void ensure_available(size_t count) const;

    std::vector<uint8_t> data_;
    size_t position_ = 0;
};

}  // namespace flow::kernel::protocol
