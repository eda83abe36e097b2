// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file errors.hpp
 * @brief Exceptions thrown by the JSONRPC client and its collaborators.
 *
 * Transport-level failures (@c decode_error, @c connection_closed_error)
 * end the connection and fail every outstanding call.  Call-level failures
 * (@c remote_error, @c cancelled_error) only concern the call that saw
 * them.  Misuse of an API is a @c std::logic_error.
 */

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace drillsp {

/** @brief The server subprocess could not be started. */
struct launch_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/** @brief An inbound frame or message body is malformed. */
struct decode_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/** @brief The peer answered a call with a JSONRPC error object. */
struct remote_error : std::runtime_error {
  remote_error(std::int64_t c, const std::string& m, boost::json::value d)
      : std::runtime_error{m}, code{c}, data{std::move(d)} {}
  std::int64_t code;
  boost::json::value data;
};

/** @brief A call timed out or its awaiting coroutine was cancelled. */
struct cancelled_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/** @brief The connection is gone: closed, failed, or unwritable. */
struct connection_closed_error : std::runtime_error {
  using std::runtime_error::runtime_error;
};

/** @brief A socket-only operation was invoked on a pipe pair. */
struct unsupported_operation : std::logic_error {
  using std::logic_error::logic_error;
};

/** @brief An LSP operation was issued out of handshake order. */
struct sequence_error : std::logic_error {
  using std::logic_error::logic_error;
};

}  // namespace drillsp
