// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <functional>
#include <sstream>
#include <stdexcept>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"

struct UnformattableType {
    int value;

    UnformattableType(int v) : value(v) {}

    friend std::ostream& operator<<(std::ostream& os, const UnformattableType& obj) {
        return os << "UnformattableType(" << obj.value << ")";
    }

    // Note: No fmt::formatter specialization - this makes it unformattable by fmt
};

TEST(Assert, AssertMessage) {
    struct TestCase {
        std::string description;
        std::function<void(std::stringstream&)> test_func;
        std::string expected_output;
    };

    std::vector<TestCase> test_cases = {
        {"Single argument",
         [](std::stringstream& output) { flow::assert::flow_assert_message(output, "Single message"); },
         "Single message\n"},
        {"With formatting",
         [](std::stringstream& output) { flow::assert::flow_assert_message(output, "Port is {}", 8813); },
         "Port is 8813\n"},
        {"Multiple args with formatting",
         [](std::stringstream& output) {
             flow::assert::flow_assert_message(output, "Engine: {}, clients: {}", "sumo", 2);
         },
         "Engine: sumo, clients: 2\n"},
        {"No formatting fallback",
         [](std::stringstream& output) { flow::assert::flow_assert_message(output, "First", "Second", "Third"); },
         "First\nSecond\nThird\n"},
        {"Empty string", [](std::stringstream& output) { flow::assert::flow_assert_message(output, ""); }, "\n"},
        {"Float and double",
         [](std::stringstream& output) {
             flow::assert::flow_assert_message(output, "Step: {}, resolution: {}", 0.1f, 0.25);
         },
         "Step: 0.1, resolution: 0.25\n"},
        {"String objects",
         [](std::stringstream& output) {
             std::string vehicle = "veh3";
             flow::assert::flow_assert_message(output, "Vehicle '{}' teleported", vehicle);
         },
         "Vehicle 'veh3' teleported\n"},
        {"Invalid format fallback",
         [](std::stringstream& output) { flow::assert::flow_assert_message(output, "Invalid format {", "value"); },
         "Invalid format {\nvalue\n"},
        {"Negative numbers",
         [](std::stringstream& output) { flow::assert::flow_assert_message(output, "Teleport after {}", -1); },
         "Teleport after -1\n"}};

    for (const auto& test_case : test_cases) {
        std::stringstream output;
        test_case.test_func(output);
        EXPECT_EQ(output.str(), test_case.expected_output) << "Test: " << test_case.description;
    }
}

TEST(Assert, UnformattableTypes) {
    std::stringstream output;
    EXPECT_THROW(
        {
            UnformattableType obj(456);
            flow::assert::flow_assert_message(output, "Unformattable: {}", obj);
        },
        std::runtime_error);
}

TEST(Assert, MismatchedPlaceholders) {
    {
        std::stringstream output;
        EXPECT_THROW({ flow::assert::flow_assert_message(output, "Value {} and {} more", 42); }, std::runtime_error);
    }

    {
        std::stringstream output;
        EXPECT_THROW(
            { flow::assert::flow_assert_message(output, "Only {}", "first", "second", "third"); },
            std::runtime_error);
    }
}

TEST(Assert, MacroIntegration) {
    try {
        FLOW_THROW("Error with value {}", 42);
        FAIL() << "Expected exception";
    } catch (const std::runtime_error& e) {
        std::string error_msg = e.what();
        EXPECT_TRUE(error_msg.find("Error with value 42") != std::string::npos);
        EXPECT_TRUE(error_msg.find("FLOW_THROW") != std::string::npos);
    }

    try {
        FLOW_ASSERT(false, "Assertion failed with value {}", 123);
        FAIL() << "Expected exception";
    } catch (const std::runtime_error& e) {
        std::string error_msg = e.what();
        EXPECT_TRUE(error_msg.find("Assertion failed with value 123") != std::string::npos);
    }

    EXPECT_NO_THROW(FLOW_ASSERT(true, "Never shown"));
}

TEST(Assert, TypedThrow) {
    try {
        FLOW_THROW_AS(flow::kernel::ConnectError, "Engine on port {} refused", 8813);
        FAIL() << "Expected exception";
    } catch (const flow::kernel::ConnectError& e) {
        std::string error_msg = e.what();
        EXPECT_TRUE(error_msg.find("Engine on port 8813 refused") != std::string::npos);
        EXPECT_TRUE(error_msg.find("ConnectError") != std::string::npos);
    }

    EXPECT_THROW(FLOW_THROW_AS(flow::kernel::SpawnError, "gone"), flow::kernel::KernelError);
}
