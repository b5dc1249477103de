/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#include "flow/kernel/subsystem/engine_traffic_light_state.hpp"

#include "assert.hpp"
#include "flow/kernel/exceptions.hpp"
#include "flow/kernel/protocol/protocol_constants.hpp"
#include "logger.hpp"

namespace flow::kernel {

using namespace protocol;

void EngineTrafficLightState::pass_connection(const ConnectionHandle& connection) {
    connection_ = connection;

    Value id_list = connection_.get_variable(Domain::TRAFFIC_LIGHT, TRACI_ID_LIST, "");
    const std::vector<std::string>* ids = value_as_string_list(id_list);
    if (ids == nullptr) {
        FLOW_THROW_AS(ProtocolError, "Engine answered the traffic light id list with a non-list value");
    }
    ids_ = *ids;

    for (const std::string& traffic_light_id : ids_) {
        connection_.subscribe(Domain::TRAFFIC_LIGHT, traffic_light_id, {TL_RED_YELLOW_GREEN_STATE});
    }
    FLOW_DEBUG("Following {} traffic lights", ids_.size());
}

void EngineTrafficLightState::update(bool reset) {
    if (!connection_.is_valid()) {
        FLOW_THROW_AS(NotStartedError, "Traffic light state updated before receiving a connection");
    }
    if (reset) {
        states_.clear();
    }

    const SubscriptionResults& results = connection_.get_subscription_results(Domain::TRAFFIC_LIGHT);
    for (const std::string& traffic_light_id : ids_) {
        auto values = results.find(traffic_light_id);
        if (values == results.end()) {
            continue;
        }
        auto state = values->second.find(TL_RED_YELLOW_GREEN_STATE);
        if (state == values->second.end()) {
            continue;
        }
        if (const std::string* text = value_as_string(state->second)) {
            states_[traffic_light_id] = *text;
        }
    }
}

std::string EngineTrafficLightState::get_state(const std::string& traffic_light_id) const {
    auto it = states_.find(traffic_light_id);
    if (it == states_.end()) {
        FLOW_THROW("No state known for traffic light '{}'", traffic_light_id);
    }
    return it->second;
}

}  // namespace flow::kernel
