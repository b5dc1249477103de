/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/core.h>
#include <fmt/ostream.h>
#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include <spdlog/spdlog.h>

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace flow::assert {

inline void flow_assert_message(std::ostream& os) {}

template <typename T, typename... Ts>
void flow_assert_message(std::ostream& os, T const& t, Ts const&... ts) {
    if constexpr (sizeof...(ts) == 0) {
        os << t << std::endl;
        return;
    }

    std::ostringstream oss;
    oss << t;
    std::string format_str = oss.str();

    size_t placeholder_count = 0;
    size_t pos = 0;
    while ((pos = format_str.find("{}", pos)) != std::string::npos) {
        placeholder_count++;
        pos += 2;
    }

    if (placeholder_count == 0) {
        os << t << std::endl;
        ((os << ts << std::endl), ...);
        return;
    }

    if (placeholder_count != sizeof...(ts)) {
        throw std::runtime_error(
            "Failed formatting: placeholder count mismatch: format string '" + format_str + "' has " +
            std::to_string(placeholder_count) + " placeholders but " + std::to_string(sizeof...(ts)) +
            " arguments provided");
    }

    // Unformattable argument types must not reach fmt::format, even in a discarded branch of the caller.
    if constexpr ((fmt::is_formattable<Ts>::value && ...)) {
        std::string formatted = fmt::format(fmt::runtime(format_str), ts...);
        os << formatted << std::endl;
    } else {
        throw std::runtime_error("Failed to format string: " + format_str + ", arguments not formattable by fmt.");
    }
}

template <typename ExceptionT = std::runtime_error, typename... Ts>
[[noreturn]] void flow_throw(
    char const* file, int line, const std::string& assert_type, char const* condition_str, Ts const&... messages) {
    std::stringstream trace_message_ss = {};
    trace_message_ss << assert_type << " @ " << file << ":" << line << ": " << condition_str << std::endl;
    if constexpr (sizeof...(messages) > 0) {
        flow_assert_message(trace_message_ss, messages...);
    }
    trace_message_ss << std::flush;
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    throw ExceptionT(trace_message_ss.str());
}

template <typename... Ts>
void flow_assert(
    char const* file,
    int line,
    const std::string& assert_type,
    bool condition,
    char const* condition_str,
    Ts const&... messages) {
    if (not condition) {
        ::flow::assert::flow_throw(file, line, assert_type, condition_str, messages...);
    }
}

}  // namespace flow::assert

#define FLOW_ASSERT(condition, ...) \
    ::flow::assert::flow_assert(__FILE__, __LINE__, "FLOW_ASSERT", (condition), #condition, ##__VA_ARGS__)
#define FLOW_THROW(...) ::flow::assert::flow_throw(__FILE__, __LINE__, "FLOW_THROW", "flow::exception", ##__VA_ARGS__)
// Throws one of the typed kernel errors so callers can tell failure classes apart.
#define FLOW_THROW_AS(exception_type, ...)     \
    ::flow::assert::flow_throw<exception_type>( \
        __FILE__, __LINE__, #exception_type, "flow::exception", ##__VA_ARGS__)
