/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <stdexcept>

namespace flow::kernel {

// Base of every error the kernel raises on purpose.
class KernelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Unknown backend or invalid SimulationConfig. Raised before any process exists.
class ConfigurationError : public KernelError {
public:
    using KernelError::KernelError;
};

// The engine binary could not be located or started, or died before accepting connections.
class SpawnError : public KernelError {
public:
    using KernelError::KernelError;
};

// No control-protocol session could be established with the engine.
class ConnectError : public KernelError {
public:
    using KernelError::KernelError;
};

// Step, collision query or kernel update issued before the simulation was started.
class NotStartedError : public KernelError {
public:
    using KernelError::KernelError;
};

// Malformed frame, error status reported by the engine, or socket failure during a session.
class ProtocolError : public KernelError {
public:
    using KernelError::KernelError;
};

}  // namespace flow::kernel
