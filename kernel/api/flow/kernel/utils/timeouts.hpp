/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace flow::kernel::timeout {
inline constexpr auto ENGINE_SETTLE_DELAY = std::chrono::milliseconds(1'000);
inline constexpr auto TEST_MODE_SETTLE_DELAY = std::chrono::milliseconds(100);

inline constexpr auto CONNECT_RETRY_DELAY = std::chrono::milliseconds(1'000);

inline constexpr auto ENGINE_TERMINATION_GRACE = std::chrono::milliseconds(2'000);
inline constexpr auto ENGINE_REAP_POLL_INTERVAL = std::chrono::milliseconds(10);
}  // namespace flow::kernel::timeout
