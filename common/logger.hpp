/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 */

#pragma once

#include <atomic>
#include <string>

#ifndef SPDLOG_FMT_EXTERNAL
#define SPDLOG_FMT_EXTERNAL
#endif
#include <spdlog/spdlog.h>

namespace flow::logger {

/**
 * Parameters controlling the behavior of the logger.
 */
struct Options {
    bool log_to_stderr{true};
    std::string filename{};
    std::string pattern{"[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v"};
    spdlog::level::level_enum log_level{spdlog::level::info};
};

/**
 * One-time initialization of the logger.
 *
 * If you don't call it, the logger will be initialized with default options the
 * first time a message is logged.
 */
void initialize(const Options& options = Options{});

/**
 * Changes the level of an already initialized logger.
 */
void set_level(spdlog::level::level_enum level);

/**
 * Parses "trace", "debug", "info", "warn", "error", "critical" or "off".
 * Throws std::runtime_error for anything else.
 */
spdlog::level::level_enum parse_level(const std::string& name);

/**
 * Macros for using the logger.
 */
#define FLOW_TRACE(...)                             \
    do {                                            \
        ::flow::logger::detail::ensure_initialized(); \
        SPDLOG_TRACE(__VA_ARGS__);                  \
    } while (0)

#define FLOW_DEBUG(...)                             \
    do {                                            \
        ::flow::logger::detail::ensure_initialized(); \
        SPDLOG_DEBUG(__VA_ARGS__);                  \
    } while (0)

#define FLOW_INFO(...)                              \
    do {                                            \
        ::flow::logger::detail::ensure_initialized(); \
        SPDLOG_INFO(__VA_ARGS__);                   \
    } while (0)

#define FLOW_WARN(...)                              \
    do {                                            \
        ::flow::logger::detail::ensure_initialized(); \
        SPDLOG_WARN(__VA_ARGS__);                   \
    } while (0)

#define FLOW_ERROR(...)                             \
    do {                                            \
        ::flow::logger::detail::ensure_initialized(); \
        SPDLOG_ERROR(__VA_ARGS__);                  \
    } while (0)

#define FLOW_CRITICAL(...)                          \
    do {                                            \
        ::flow::logger::detail::ensure_initialized(); \
        SPDLOG_CRITICAL(__VA_ARGS__);               \
    } while (0)

/**
 * This is not part of the API.
 */
namespace detail {
extern std::atomic_bool is_initialized;

inline void ensure_initialized() {
    if (!is_initialized.load(std::memory_order_acquire)) {
        initialize();
    }
}

}  // namespace detail

}  // namespace flow::logger
