/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdlib>
#include <optional>
#include <random>
#include <string>

#include "assert.hpp"

namespace flow::utils {

static std::optional<std::string> get_env_var_value(const char* env_var_name) {
    const char* env_var = std::getenv(env_var_name);
    if (!env_var) {
        return std::nullopt;
    }
    return std::string(env_var);
}

// Unset, empty and "0" count as false.
static bool get_env_flag(const char* env_var_name) {
    const std::optional<std::string> value = get_env_var_value(env_var_name);
    return value.has_value() && !value->empty() && *value != "0";
}

static bool is_port_free(int port) {
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        return false;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(port);

    bool free = (bind(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    close(sock);
    return free;
}

// Every kernel needs a port of its own, so parallel workers draw one at random from [low, high].
static int find_free_port(int low = 10000, int high = 60000, int max_tries = 1000) {
    FLOW_ASSERT(low > 0 && low <= high && high <= 65535, "Invalid port range [{}, {}]", low, high);
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(low, high);

    for (int i = 0; i < max_tries; ++i) {
        int port = dis(gen);
        if (is_port_free(port)) {
            return port;
        }
    }
    FLOW_THROW("No free port found in [{}, {}] after {} tries", low, high, max_tries);
}

}  // namespace flow::utils
