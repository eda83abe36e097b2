// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file jsonrpc.hpp
 * @brief JSONRPC 2.0 message framing over a @c pipe_stream.
 *
 * Messages are framed using the Content-Length header convention of the
 * Language Server Protocol: each message is preceded by a header block of
 * the form @c "Content-Length: N\r\n\r\n" followed by exactly @c N bytes of
 * UTF-8 JSON text.  Other headers are tolerated and ignored.  The
 * coroutines are meant to be used with @c co_await.
 */

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "drillsp/pipe_stream.hpp"

namespace drillsp {

/** @brief Read one framed JSONRPC message from @p stream.
 *
 * @p pending holds bytes that were read from @p stream but not consumed
 * yet.  Pass the same string to every call on one stream: a single read
 * may pull in the start of the next message, and those bytes must
 * survive until the next call.  Returns the raw JSON text, or an empty
 * optional if the stream reaches EOF before a complete message.  Throws
 * @c decode_error if the header block has no usable Content-Length or
 * doesn't end within 64KiB.
 */
boost::asio::awaitable<std::optional<std::string>> read_jsonrpc_message(
    pipe_stream& stream, std::string& pending);

/** @brief Write one framed JSONRPC message to @p stream.
 *
 * Serialises @p msg to JSON, prepends the appropriate
 * @c Content-Length header, and writes the complete frame to @p stream
 * as a single async operation.
 */
boost::asio::awaitable<void> write_jsonrpc_message(
    pipe_stream& stream, const boost::json::object& msg);

/** @brief The complete frame, header and body, for @p msg. */
std::string frame_jsonrpc_message(const boost::json::object& msg);

/** @brief Extract the body length from a header block.
 *
 * @p headers is everything up to and including the blank line.  Throws
 * @c decode_error when Content-Length is missing or not a number.  The
 * header name must start a line.
 */
std::size_t parse_content_length(std::string_view headers);

}  // namespace drillsp
