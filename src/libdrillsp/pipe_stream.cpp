// SPDX-License-Identifier: MIT
#include "drillsp/pipe_stream.hpp"

#include <boost/system/error_code.hpp>
#include <utility>

#include "drillsp/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace asio = boost::asio;
namespace sys = boost::system;

pipe_stream::pipe_stream(
    asio::readable_pipe in, asio::writable_pipe out, bool trace)
    : in_{std::move(in)}, out_{std::move(out)}, trace_{trace} {}

void pipe_stream::close() {
  sys::error_code ec;
  if (in_.is_open()) in_.close(ec);
  if (ec) LOG_DEBUG("closing inbound pipe: {}", ec.message());
  ec.clear();
  if (out_.is_open()) out_.close(ec);
  if (ec) LOG_DEBUG("closing outbound pipe: {}", ec.message());
}

bool pipe_stream::is_open() const { return in_.is_open() || out_.is_open(); }

void pipe_stream::shutdown(asio::socket_base::shutdown_type /*what*/) {
  throw unsupported_operation{"pipe_stream: shutdown() of one direction"};
}

void pipe_stream::expires_after(std::chrono::steady_clock::duration /*d*/) {
  throw unsupported_operation{"pipe_stream: deadlines are not supported"};
}

void pipe_stream::local_endpoint() const {
  throw unsupported_operation{"pipe_stream: pipes have no local address"};
}

void pipe_stream::remote_endpoint() const {
  throw unsupported_operation{"pipe_stream: pipes have no remote address"};
}

void pipe_stream::log_transfer(
    std::string_view direction, const sys::error_code& ec,
    std::string_view bytes) const {
  if (ec && bytes.empty()) {
    LOG_INFO("pipe {} failed: {}", direction, ec.message());
    return;
  }
  LOG_INFO(
      "pipe {} {} bytes: {}", direction, bytes.size(),
      utils::elide(bytes, 1024));
}

}  // namespace drillsp
