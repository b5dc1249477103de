/*
 * SPDX-FileCopyrightText: (c) 2025 Flow Kernel Authors
 *
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

#ifdef FLOW_KERNEL_USE_BOOST
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace flow::kernel {
namespace asio = boost::asio;
using error_code = boost::system::error_code;
using system_error = boost::system::system_error;
}  // namespace flow::kernel

#else
#include <asio.hpp>

namespace flow::kernel {
namespace asio = ::asio;
using error_code = std::error_code;
using system_error = std::system_error;
}  // namespace flow::kernel

#endif
