/*
 * SPDX-FileCopyrightText: (c) 2025 Tenstorrent Inc.
 *
 * SPDX-License-Identifier: Apache-2.0
 */
#pragma once

// Standalone asio by default; TT_RESET_USE_BOOST switches to the Boost.Asio bundled with Boost.
#ifdef TT_RESET_USE_BOOST
#include <boost/asio.hpp>
#include <boost/system/error_code.hpp>

namespace tt::reset {
namespace asio = boost::asio;
using error_code = boost::system::error_code;
using system_error = boost::system::system_error;
}  // namespace tt::reset

#else
#include <asio.hpp>

namespace tt::reset {
namespace asio = ::asio;
using error_code = std::error_code;
using system_error = std::system_error;
}  // namespace tt::reset

#endif

namespace tt::reset {
// Reset notifications between processes on the same host.
using local_stream = asio::local::stream_protocol;
}  // namespace tt::reset
