/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

// Identifiers of the engine control protocol (TraCI). Values are fixed by the engine.
namespace flow::kernel::protocol {

// Commands.
inline constexpr uint8_t CMD_GETVERSION = 0x00;
inline constexpr uint8_t CMD_SIMSTEP = 0x02;
inline constexpr uint8_t CMD_SETORDER = 0x03;
inline constexpr uint8_t CMD_CLOSE = 0x7F;

inline constexpr uint8_t CMD_GET_TL_VARIABLE = 0xa2;
inline constexpr uint8_t CMD_GET_VEHICLE_VARIABLE = 0xa4;
inline constexpr uint8_t CMD_GET_SIM_VARIABLE = 0xab;

inline constexpr uint8_t CMD_SUBSCRIBE_TL_VARIABLE = 0xd2;
inline constexpr uint8_t CMD_SUBSCRIBE_VEHICLE_VARIABLE = 0xd4;
inline constexpr uint8_t CMD_SUBSCRIBE_SIM_VARIABLE = 0xdb;

// Responses to get and subscribe commands carry the command id plus this offset.
inline constexpr uint8_t RESPONSE_OFFSET = 0x10;

inline constexpr uint8_t RESPONSE_SUBSCRIBE_TL_VARIABLE = 0xe2;
inline constexpr uint8_t RESPONSE_SUBSCRIBE_VEHICLE_VARIABLE = 0xe4;
inline constexpr uint8_t RESPONSE_SUBSCRIBE_SIM_VARIABLE = 0xeb;

// Status codes.
inline constexpr uint8_t RTYPE_OK = 0x00;
inline constexpr uint8_t RTYPE_NOTIMPLEMENTED = 0x01;
inline constexpr uint8_t RTYPE_ERR = 0xFF;

// Value types.
inline constexpr uint8_t POSITION_2D = 0x01;
inline constexpr uint8_t TYPE_UBYTE = 0x07;
inline constexpr uint8_t TYPE_BYTE = 0x08;
inline constexpr uint8_t TYPE_INTEGER = 0x09;
inline constexpr uint8_t TYPE_DOUBLE = 0x0B;
inline constexpr uint8_t TYPE_STRING = 0x0C;
inline constexpr uint8_t TYPE_STRINGLIST = 0x0E;

// Variables shared by all domains.
inline constexpr uint8_t TRACI_ID_LIST = 0x00;

// Simulation variables.
inline constexpr uint8_t VAR_TIME_STEP = 0x70;
inline constexpr uint8_t VAR_DEPARTED_VEHICLES_IDS = 0x74;
inline constexpr uint8_t VAR_TELEPORT_STARTING_VEHICLES_IDS = 0x76;
inline constexpr uint8_t VAR_ARRIVED_VEHICLES_IDS = 0x7a;
inline constexpr uint8_t VAR_DELTA_T = 0x7b;

// Vehicle variables.
inline constexpr uint8_t VAR_SPEED = 0x40;
inline constexpr uint8_t VAR_POSITION = 0x42;
inline constexpr uint8_t VAR_ROAD_ID = 0x50;
inline constexpr uint8_t VAR_LANE_INDEX = 0x52;
inline constexpr uint8_t VAR_ROUTE_ID = 0x53;
inline constexpr uint8_t VAR_LANEPOSITION = 0x56;

// Traffic light variables.
inline constexpr uint8_t TL_RED_YELLOW_GREEN_STATE = 0x20;

// Begin/end time meaning "whole simulation" in subscribe commands.
inline constexpr double INVALID_DOUBLE_VALUE = -1073741824.0;

}  // namespace flow::kernel::protocol
