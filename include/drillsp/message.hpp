// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file message.hpp
 * @brief Typed JSONRPC 2.0 messages and their JSON encoding.
 *
 * A frame body decodes to one of three shapes, told apart by which
 * fields are present:
 *
 *   - @c id and @c method: a call, the sender expects a response;
 *   - @c id only: a response to an earlier call;
 *   - @c method only: a notification.
 *
 * Parameters and results are kept as raw @c boost::json::value so the
 * codec never loses or reinterprets a payload.
 */

#include <boost/json.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace drillsp {

// JSONRPC error codes
namespace rpc_errc {
constexpr int parse_error{-32700};
constexpr int invalid_request{-32600};
constexpr int method_not_found{-32601};
constexpr int invalid_params{-32602};
constexpr int internal_error{-32603};
}  // namespace rpc_errc

/// A JSONRPC id.  We only ever send integers, the peer may use strings,
/// and a response to an unreadable request carries @c null.
using request_id = std::variant<std::nullptr_t, std::int64_t, std::string>;

struct response_error {
  std::int64_t code{};
  std::string message;
  boost::json::value data{};
};

struct call_message {
  request_id id;
  std::string method;
  boost::json::value params{};
};

struct response_message {
  request_id id;
  boost::json::value result{};
  std::optional<response_error> error{};
};

struct notification_message {
  std::string method;
  boost::json::value params{};
};

using message =
    std::variant<call_message, response_message, notification_message>;

/** @brief Encode @p msg as a JSONRPC 2.0 object.  Null params are left
 * out. */
boost::json::object encode_message(const message& msg);

/** @brief Decode one frame body.  Throws @c decode_error. */
message decode_message(std::string_view text);

boost::json::value id_to_json(const request_id& id);
std::string to_string(const request_id& id);

/// Convenience builders for answering a peer call.
response_message make_result(request_id id, boost::json::value result);
response_message make_error(
    request_id id, int code, std::string message,
    boost::json::value data = nullptr);

}  // namespace drillsp
