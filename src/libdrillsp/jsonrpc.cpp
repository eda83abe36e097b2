// SPDX-License-Identifier: MIT
#include "drillsp/jsonrpc.hpp"

#include <fmt/format.h>
#include <re2/re2.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include "drillsp/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace asio = boost::asio;
namespace sys = boost::system;

// Anything larger than this is a corrupt header, not a real message.
constexpr std::size_t max_content_length{std::size_t{1} << 30};
// Headers are a couple of short lines; more than this has no terminator.
constexpr std::size_t max_header_bytes{std::size_t{64} << 10};

std::size_t parse_content_length(std::string_view headers) {
  static const RE2 content_length_re{R"((?im)^content-length:[ \t]*(\d+))"};

  std::string digits;
  if (!RE2::PartialMatch(headers, content_length_re, &digits)) {
    utils::throwf<decode_error>(
        "Missing Content-Length header in '{}'", utils::elide(headers, 80));
  }

  std::size_t length{};
  for (char c : digits) {
    if (length > (max_content_length - (c - '0')) / 10) {
      utils::throwf<decode_error>("Content-Length {} is too large", digits);
    }
    length = length * 10 + static_cast<std::size_t>(c - '0');
  }
  return length;
}

asio::awaitable<std::optional<std::string>> read_jsonrpc_message(
    pipe_stream& stream, std::string& pending) {
  try {
    auto buf{asio::dynamic_buffer(pending)};

    // Read headers until \r\n\r\n
    std::size_t header_size{};
    try {
      auto headers{
        asio::dynamic_buffer(pending, pending.size() + max_header_bytes)};
      header_size = co_await asio::async_read_until(
          stream, headers, "\r\n\r\n", asio::use_awaitable);
    } catch (const sys::system_error& e) {
      if (e.code() != asio::error::not_found) throw;
      utils::throwf<decode_error>(
          "No end of headers in {} bytes: '{}'", pending.size(),
          utils::elide(pending, 80));
    }

    std::size_t content_length{parse_content_length(
        std::string_view{pending}.substr(0, header_size))};
    buf.consume(header_size);

    // Whatever is already buffered counts towards the body; read the rest
    if (pending.size() < content_length) {
      co_await asio::async_read(
          stream, buf, asio::transfer_exactly(content_length - pending.size()),
          asio::use_awaitable);
    }

    std::string content{pending.substr(0, content_length)};
    buf.consume(content_length);
    co_return content;

  } catch (const sys::system_error& e) {
    if (e.code() == asio::error::eof) {
      if (!pending.empty()) {
        LOG_WARN(
            "Stream ended inside a message, dropping {} bytes",
            pending.size());
      }
      co_return std::nullopt;
    }
    throw;
  }
}

std::string frame_jsonrpc_message(const boost::json::object& msg) {
  std::string json_str{boost::json::serialize(msg)};
  return fmt::format("Content-Length: {}\r\n\r\n{}", json_str.size(), json_str);
}

asio::awaitable<void> write_jsonrpc_message(
    pipe_stream& stream, const boost::json::object& msg) {
  std::string full_msg{frame_jsonrpc_message(msg)};

  co_await asio::async_write(
      stream, asio::buffer(full_msg), asio::use_awaitable);
}

}  // namespace drillsp
