/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/sim_control/sim_control.hpp"

namespace flow::kernel {

std::string to_string(SimControlState state) {
    switch (state) {
        case SimControlState::IDLE:
            return "idle";
        case SimControlState::STARTING:
            return "starting";
        case SimControlState::RUNNING:
            return "running";
        case SimControlState::CLOSED:
            return "closed";
    }
    return "unknown";
}

}  // namespace flow::kernel
