/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/subsystem/engine_vehicle_state.hpp"

#include <algorithm>

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"
#include "logger.hpp"

namespace flow::kernel {

using namespace protocol;

namespace {

const std::vector<uint8_t> VEHICLE_SUBSCRIPTION = {
    VAR_SPEED,
    VAR_POSITION,
    VAR_ROAD_ID,
    VAR_LANE_INDEX,
    VAR_LANEPOSITION,
    VAR_ROUTE_ID,
};

std::vector<std::string> get_id_list(const VariableMap* values, uint8_t variable) {
    if (values == nullptr) {
        return {};
    }
    auto it = values->find(variable);
    if (it == values->end()) {
        return {};
    }
    const std::vector<std::string>* ids = value_as_string_list(it->second);
    return ids != nullptr ? *ids : std::vector<std::string>{};
}

}  // namespace

void EngineVehicleState::pass_connection(const ConnectionHandle& connection) { connection_ = connection; }

void EngineVehicleState::update(bool reset) {
    if (!connection_.is_valid()) {
        FLOW_THROW_AS(NotStartedError, "Vehicle state updated before receiving a connection");
    }

    const VariableMap* simulation_values = connection_.get_simulation_values();
    departed_ids_ = get_id_list(simulation_values, VAR_DEPARTED_VEHICLES_IDS);
    arrived_ids_ = get_id_list(simulation_values, VAR_ARRIVED_VEHICLES_IDS);

    if (reset) {
        resynchronise();
    } else {
        // A vehicle may depart and arrive within one step; it is never tracked.
        for (const std::string& vehicle_id : departed_ids_) {
            if (std::find(arrived_ids_.begin(), arrived_ids_.end(), vehicle_id) == arrived_ids_.end()) {
                add_vehicle(vehicle_id);
            }
        }
        for (const std::string& vehicle_id : arrived_ids_) {
            vehicles_.erase(vehicle_id);
        }
    }

    const SubscriptionResults& results = connection_.get_subscription_results(Domain::VEHICLE);
    for (auto& [vehicle_id, values] : vehicles_) {
        auto it = results.find(vehicle_id);
        if (it != results.end()) {
            values = it->second;
        }
    }
}

void EngineVehicleState::add_vehicle(const std::string& vehicle_id) {
    connection_.subscribe(Domain::VEHICLE, vehicle_id, VEHICLE_SUBSCRIPTION);
    vehicles_.emplace(vehicle_id, VariableMap{});
}

void EngineVehicleState::resynchronise() {
    vehicles_.clear();

    Value id_list = connection_.get_variable(Domain::VEHICLE, TRACI_ID_LIST, "");
    const std::vector<std::string>* ids = value_as_string_list(id_list);
    if (ids == nullptr) {
        FLOW_THROW_AS(ProtocolError, "Engine answered the vehicle id list with a non-list value");
    }
    for (const std::string& vehicle_id : *ids) {
        add_vehicle(vehicle_id);
    }
    FLOW_DEBUG("Vehicle state reset with {} vehicles", vehicles_.size());
}

std::vector<std::string> EngineVehicleState::get_ids() const {
    std::vector<std::string> ids;
    ids.reserve(vehicles_.size());
    for (const auto& [vehicle_id, values] : vehicles_) {
        ids.push_back(vehicle_id);
    }
    return ids;
}

const Value& EngineVehicleState::get_value(const std::string& vehicle_id, uint8_t variable) const {
    auto vehicle = vehicles_.find(vehicle_id);
    if (vehicle == vehicles_.end()) {
        FLOW_THROW("Unknown vehicle '{}'", vehicle_id);
    }
    auto value = vehicle->second.find(variable);
    if (value == vehicle->second.end()) {
        FLOW_THROW("No value of variable {} for vehicle '{}'", static_cast<int>(variable), vehicle_id);
    }
    return value->second;
}

double EngineVehicleState::get_speed(const std::string& vehicle_id) const {
    std::optional<double> speed = value_as_double(get_value(vehicle_id, VAR_SPEED));
    FLOW_ASSERT(speed.has_value(), "Speed of vehicle '{}' is not numeric", vehicle_id);
    return *speed;
}

Position2D EngineVehicleState::get_position(const std::string& vehicle_id) const {
    const Value& value = get_value(vehicle_id, VAR_POSITION);
    const Position2D* position = std::get_if<Position2D>(&value);
    FLOW_ASSERT(position != nullptr, "Position of vehicle '{}' is not a 2D position", vehicle_id);
    return *position;
}

std::string EngineVehicleState::get_edge(const std::string& vehicle_id) const {
    const std::string* edge = value_as_string(get_value(vehicle_id, VAR_ROAD_ID));
    FLOW_ASSERT(edge != nullptr, "Edge of vehicle '{}' is not a string", vehicle_id);
    return *edge;
}

int EngineVehicleState::get_lane(const std::string& vehicle_id) const {
    std::optional<double> lane = value_as_double(get_value(vehicle_id, VAR_LANE_INDEX));
    FLOW_ASSERT(lane.has_value(), "Lane of vehicle '{}' is not numeric", vehicle_id);
    return static_cast<int>(*lane);
}

double EngineVehicleState::get_lane_position(const std::string& vehicle_id) const {
    std::optional<double> position = value_as_double(get_value(vehicle_id, VAR_LANEPOSITION));
    FLOW_ASSERT(position.has_value(), "Lane position of vehicle '{}' is not numeric", vehicle_id);
    return *position;
}

std::string EngineVehicleState::get_route(const std::string& vehicle_id) const {
    const std::string* route = value_as_string(get_value(vehicle_id, VAR_ROUTE_ID));
    FLOW_ASSERT(route != nullptr, "Route of vehicle '{}' is not a string", vehicle_id);
    return *route;
}

}  // namespace flow::kernel
