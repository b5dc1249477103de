/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */
#include <nanobind/nanobind.h>

namespace nb = nanobind;

// Forward declarations for binding functions from each module.
void bind_logging(nb::module_ &m);
void bind_config(nb::module_ &m);
void bind_kernel(nb::module_ &m);

// Main module entry point.
NB_MODULE(flow_kernel, m) {
    bind_logging(m);
    bind_config(m);
    bind_kernel(m);
}
