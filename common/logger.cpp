/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger.hpp"

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

#include <mutex>
#include <vector>

#include "assert.hpp"

namespace flow::logger {

void initialize(const Options& options) {
    static std::mutex mutex;
    std::scoped_lock lock{mutex};

    if (detail::is_initialized.load(std::memory_order_relaxed)) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    if (options.log_to_stderr) {
        auto stderr_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
        sinks.push_back(stderr_sink);
    }

    if (!options.filename.empty()) {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.filename);
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("FLOW", sinks.begin(), sinks.end());
    logger->set_level(options.log_level);
    logger->set_pattern(options.pattern);

    spdlog::set_default_logger(logger);
    detail::is_initialized.store(true, std::memory_order_release);
}

void set_level(spdlog::level::level_enum level) {
    detail::ensure_initialized();
    spdlog::default_logger()->set_level(level);
}

spdlog::level::level_enum parse_level(const std::string& name) {
    // spdlog::level::from_str maps unknown names to "off", so check the round trip.
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        FLOW_THROW("Unknown log level '{}'", name);
    }
    return level;
}

namespace detail {
std::atomic_bool is_initialized = false;
}

}  // namespace flow::logger
