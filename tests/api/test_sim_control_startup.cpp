// SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
//
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <memory>

#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"
#include "flow/kernel/sim_control/engine_sim_control.hpp"
#include "test_utils/fake_connection.hpp"
#include "test_utils/spy_startup.hpp"

using namespace flow::kernel;
using namespace flow::kernel::test;

class SimControlStartupTest : public ::testing::Test {
protected:
    void SetUp() override {
        record = std::make_shared<StartupRecord>();
        connection = std::make_shared<FakeConnection>();
        config.settle_delay = std::chrono::milliseconds(0);
        config.port = 9123;
        config.client_order = 1;
    }

    std::unique_ptr<EngineSimControl> make_sim_control(ScriptedConnector::Script script) {
        auto supervisor = std::make_unique<SpyProcessSupervisor>(record);
        spy_supervisor = supervisor.get();
        return std::make_unique<EngineSimControl>(
            std::move(supervisor), std::make_unique<ScriptedConnector>(record, std::move(script)));
    }

    // Succeeds from the given attempt on, failing with a ConnectError naming the attempt before that.
    ScriptedConnector::Script succeed_from(int first_good_attempt) {
        return [this, first_good_attempt](int attempt) -> std::shared_ptr<Connection> {
            if (attempt < first_good_attempt) {
                throw ConnectError("connection refused on attempt " + std::to_string(attempt));
            }
            return connection;
        };
    }

    std::shared_ptr<StartupRecord> record;
    std::shared_ptr<FakeConnection> connection;
    SpyProcessSupervisor* spy_supervisor = nullptr;
    SimulationConfig config;
};

TEST_F(SimControlStartupTest, FirstAttemptSucceeds) {
    auto sim_control = make_sim_control(succeed_from(1));

    ConnectionHandle handle = sim_control->start(config);

    EXPECT_TRUE(handle.is_valid());
    EXPECT_EQ(sim_control->get_state(), SimControlState::RUNNING);
    EXPECT_EQ(record->events, (std::vector<std::string>{"spawn", "connect"}));
    EXPECT_EQ(record->spawned_commands.front(), "sumo");
    // Order is set and one initial step taken before start returns.
    EXPECT_EQ(connection->order, 1);
    EXPECT_EQ(connection->steps, 1);
}

TEST_F(SimControlStartupTest, ConnectUsesConfiguredPortAndAttempts) {
    config.connect_attempts = 7;
    auto connector = std::make_unique<ScriptedConnector>(record, succeed_from(1));
    ScriptedConnector* spy_connector = connector.get();
    EngineSimControl sim_control(std::make_unique<SpyProcessSupervisor>(record), std::move(connector));

    sim_control.start(config);

    EXPECT_EQ(spy_connector->last_port, 9123);
    EXPECT_EQ(spy_connector->last_max_attempts, 7);
}

TEST_F(SimControlStartupTest, RecoversOnThirdAttempt) {
    auto sim_control = make_sim_control(succeed_from(3));

    ConnectionHandle handle = sim_control->start(config);

    EXPECT_TRUE(handle.is_valid());
    EXPECT_EQ(record->spawns, 3);
    EXPECT_EQ(record->connects, 3);
    EXPECT_EQ(record->kills, 2);
    // Every failed attempt is torn down before the next spawn.
    EXPECT_EQ(
        record->events,
        (std::vector<std::string>{"spawn", "connect", "kill", "spawn", "connect", "kill", "spawn", "connect"}));
    EXPECT_EQ(record->killed_handles[0].pid, 1001);
    EXPECT_EQ(record->killed_handles[1].pid, 1002);
    EXPECT_EQ(sim_control->get_process().pid, 1003);
}

TEST_F(SimControlStartupTest, GivesUpAfterTenAttemptsWithLastError) {
    auto sim_control = make_sim_control(succeed_from(1000));

    try {
        sim_control->start(config);
        FAIL() << "Expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_STREQ(e.what(), "connection refused on attempt 10");
    }

    EXPECT_EQ(record->spawns, EngineSimControl::STARTUP_ATTEMPTS);
    EXPECT_EQ(record->connects, EngineSimControl::STARTUP_ATTEMPTS);
    EXPECT_EQ(record->kills, EngineSimControl::STARTUP_ATTEMPTS);
    EXPECT_EQ(sim_control->get_state(), SimControlState::IDLE);
    EXPECT_THROW(sim_control->step(), NotStartedError);
}

TEST_F(SimControlStartupTest, SpawnFailuresAreRetried) {
    auto sim_control = make_sim_control(succeed_from(1));
    spy_supervisor->fail_spawn = [](int attempt) { return attempt <= 2; };

    sim_control->start(config);

    EXPECT_EQ(record->spawns, 3);
    EXPECT_EQ(record->connects, 1);
    EXPECT_EQ(record->kills, 2);
    // A failed spawn leaves no process, so teardown receives an empty handle.
    EXPECT_FALSE(record->killed_handles[0].is_valid());
}

TEST_F(SimControlStartupTest, PersistentSpawnFailureSurfacesSpawnError) {
    auto sim_control = make_sim_control(succeed_from(1));
    spy_supervisor->fail_spawn = [](int) { return true; };

    try {
        sim_control->start(config);
        FAIL() << "Expected SpawnError";
    } catch (const SpawnError& e) {
        EXPECT_STREQ(e.what(), "spawn refused on attempt 10");
    }
    EXPECT_EQ(record->connects, 0);
}

TEST_F(SimControlStartupTest, EngineDyingDuringSettleFailsTheAttempt) {
    auto sim_control = make_sim_control(succeed_from(1));
    spy_supervisor->alive = false;

    EXPECT_THROW(sim_control->start(config), SpawnError);
    EXPECT_EQ(record->spawns, EngineSimControl::STARTUP_ATTEMPTS);
    EXPECT_EQ(record->connects, 0);
}

TEST_F(SimControlStartupTest, FailureAfterConnectClosesPartialSession) {
    connection->fail_set_order = true;
    auto sim_control = make_sim_control(succeed_from(1));

    EXPECT_THROW(sim_control->start(config), ProtocolError);
    EXPECT_EQ(connection->close_calls, EngineSimControl::STARTUP_ATTEMPTS);
    EXPECT_EQ(record->kills, EngineSimControl::STARTUP_ATTEMPTS);
}

TEST_F(SimControlStartupTest, InvalidConfigSpawnsNothing) {
    auto sim_control = make_sim_control(succeed_from(1));
    config.step_length = 0;

    EXPECT_THROW(sim_control->start(config), ConfigurationError);
    EXPECT_EQ(record->spawns, 0);
}

TEST_F(SimControlStartupTest, StartTwiceIsRejected) {
    auto sim_control = make_sim_control(succeed_from(1));
    sim_control->start(config);

    EXPECT_THROW(sim_control->start(config), KernelError);
    EXPECT_EQ(record->spawns, 1);
}

TEST_F(SimControlStartupTest, StepBeforeStart) {
    auto sim_control = make_sim_control(succeed_from(1));
    EXPECT_THROW(sim_control->step(), NotStartedError);
    EXPECT_THROW(sim_control->check_collision(), NotStartedError);
}

TEST_F(SimControlStartupTest, StepAdvancesEngine) {
    auto sim_control = make_sim_control(succeed_from(1));
    sim_control->start(config);

    sim_control->step();
    sim_control->step();

    EXPECT_EQ(connection->steps, 3);
}

TEST_F(SimControlStartupTest, PassConnectionSubscribesSimulationSignals) {
    auto sim_control = make_sim_control(succeed_from(1));
    ConnectionHandle handle = sim_control->start(config);

    sim_control->pass_connection(handle);

    ASSERT_EQ(connection->subscriptions.size(), 1u);
    const SubscribeCall& call = connection->subscriptions[0];
    EXPECT_EQ(call.domain, Domain::SIMULATION);
    EXPECT_EQ(call.object_id, "");
    EXPECT_EQ(
        call.variables,
        (std::vector<uint8_t>{
            protocol::VAR_DEPARTED_VEHICLES_IDS,
            protocol::VAR_ARRIVED_VEHICLES_IDS,
            protocol::VAR_TELEPORT_STARTING_VEHICLES_IDS,
            protocol::VAR_TIME_STEP,
            protocol::VAR_DELTA_T}));
}

TEST_F(SimControlStartupTest, CollisionFollowsTeleports) {
    auto sim_control = make_sim_control(succeed_from(1));
    sim_control->start(config);

    EXPECT_FALSE(sim_control->check_collision());

    connection->set_simulation_value(
        protocol::VAR_TELEPORT_STARTING_VEHICLES_IDS, std::vector<std::string>{"veh3"});
    EXPECT_TRUE(sim_control->check_collision());

    connection->set_simulation_value(protocol::VAR_TELEPORT_STARTING_VEHICLES_IDS, std::vector<std::string>{});
    EXPECT_FALSE(sim_control->check_collision());
}

TEST_F(SimControlStartupTest, CloseTearsDownOnce) {
    auto sim_control = make_sim_control(succeed_from(1));
    sim_control->start(config);

    sim_control->close();
    sim_control->close();

    EXPECT_EQ(connection->close_calls, 1);
    EXPECT_EQ(record->kills, 1);
    EXPECT_EQ(record->killed_handles[0].pid, 1001);
    EXPECT_EQ(sim_control->get_state(), SimControlState::CLOSED);
    EXPECT_THROW(sim_control->step(), NotStartedError);
}

TEST_F(SimControlStartupTest, DestructorClosesRunningSimulation) {
    {
        auto sim_control = make_sim_control(succeed_from(1));
        sim_control->start(config);
    }
    EXPECT_EQ(connection->close_calls, 1);
    EXPECT_EQ(record->kills, 1);
}

TEST_F(SimControlStartupTest, DestructorKillsEngineOfInterruptedStart) {
    {
        auto sim_control = make_sim_control([](int) -> std::shared_ptr<Connection> { throw 42; });
        EXPECT_THROW(sim_control->start(config), int);
        EXPECT_EQ(sim_control->get_state(), SimControlState::STARTING);
        EXPECT_EQ(record->kills, 0);
    }
    ASSERT_EQ(record->kills, 1);
    EXPECT_EQ(record->killed_handles[0].pid, 1001);
}
