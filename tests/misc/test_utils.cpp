// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <stdlib.h>

#include "utils.hpp"

TEST(Utils, EnvironmentFlag) {
    unsetenv("FLOW_KERNEL_UTILS_TEST");
    EXPECT_FALSE(flow::utils::get_env_flag("FLOW_KERNEL_UTILS_TEST"));
    EXPECT_FALSE(flow::utils::get_env_var_value("FLOW_KERNEL_UTILS_TEST").has_value());

    setenv("FLOW_KERNEL_UTILS_TEST", "", 1);
    EXPECT_FALSE(flow::utils::get_env_flag("FLOW_KERNEL_UTILS_TEST"));

    setenv("FLOW_KERNEL_UTILS_TEST", "0", 1);
    EXPECT_FALSE(flow::utils::get_env_flag("FLOW_KERNEL_UTILS_TEST"));

    setenv("FLOW_KERNEL_UTILS_TEST", "yes", 1);
    EXPECT_TRUE(flow::utils::get_env_flag("FLOW_KERNEL_UTILS_TEST"));
    EXPECT_EQ(flow::utils::get_env_var_value("FLOW_KERNEL_UTILS_TEST"), "yes");

    unsetenv("FLOW_KERNEL_UTILS_TEST");
}

TEST(Utils, FindFreePort) {
    int port = flow::utils::find_free_port(20000, 30000);
    EXPECT_GE(port, 20000);
    EXPECT_LE(port, 30000);
    EXPECT_TRUE(flow::utils::is_port_free(port));
}

TEST(Utils, FindFreePortRejectsBadRange) {
    EXPECT_THROW(flow::utils::find_free_port(500, 100), std::runtime_error);
    EXPECT_THROW(flow::utils::find_free_port(0, 100), std::runtime_error);
}
