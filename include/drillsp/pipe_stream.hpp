// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file pipe_stream.hpp
 * @brief A duplex byte stream made of two independent pipes.
 *
 * A child process is reached through two unrelated file descriptors: we
 * read its stdout and write its stdin.  @c pipe_stream glues a
 * @c readable_pipe and a @c writable_pipe into one object that models both
 * Asio's AsyncReadStream and AsyncWriteStream, so framing code can treat
 * it like a socket.  Operations only a socket could honour throw
 * @c unsupported_operation instead of pretending to work.
 *
 * With tracing enabled every completed read and write is logged.  The
 * bytes and counts handed back to the caller are never touched.
 */

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/associated_cancellation_slot.hpp>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/bind_cancellation_slot.hpp>
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/socket_base.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace drillsp {

class pipe_stream {
 public:
  using executor_type = boost::asio::any_io_executor;

  pipe_stream(
      boost::asio::readable_pipe in, boost::asio::writable_pipe out,
      bool trace = false);

  pipe_stream(pipe_stream&&) = default;
  pipe_stream& operator=(pipe_stream&&) = default;
  pipe_stream(const pipe_stream&) = delete;
  pipe_stream& operator=(const pipe_stream&) = delete;
  ~pipe_stream() = default;

  executor_type get_executor() { return in_.get_executor(); }

  template <typename MutableBufferSequence, typename ReadToken>
  auto async_read_some(
      const MutableBufferSequence& buffers, ReadToken&& token) {
    return boost::asio::async_initiate<
        ReadToken, void(boost::system::error_code, std::size_t)>(
        [this](auto handler, const MutableBufferSequence& bufs) {
          in_.async_read_some(
              bufs, observed("read", bufs, std::move(handler)));
        },
        token, buffers);
  }

  template <typename ConstBufferSequence, typename WriteToken>
  auto async_write_some(
      const ConstBufferSequence& buffers, WriteToken&& token) {
    return boost::asio::async_initiate<
        WriteToken, void(boost::system::error_code, std::size_t)>(
        [this](auto handler, const ConstBufferSequence& bufs) {
          out_.async_write_some(
              bufs, observed("write", bufs, std::move(handler)));
        },
        token, buffers);
  }

  /// Close both directions, aborting any pending operation.
  void close();
  [[nodiscard]] bool is_open() const;

  void set_trace(bool on) { trace_ = on; }
  [[nodiscard]] bool trace() const { return trace_; }

  // Socket-only operations.  A pipe pair has no half-close that the
  // peer could tell apart from a full close, no deadlines and no
  // addresses.
  [[noreturn]] void shutdown(boost::asio::socket_base::shutdown_type what);
  [[noreturn]] void expires_after(std::chrono::steady_clock::duration d);
  [[noreturn]] void local_endpoint() const;
  [[noreturn]] void remote_endpoint() const;

 private:
  // Wrap a completion handler so the transfer is logged before the
  // original handler runs.  The handler keeps its executor and its
  // cancellation slot.
  template <typename Buffers, typename Handler>
  auto observed(std::string_view direction, const Buffers& buffers,
                Handler handler) {
    auto executor =
        boost::asio::get_associated_executor(handler, get_executor());
    auto slot = boost::asio::get_associated_cancellation_slot(handler);
    return boost::asio::bind_cancellation_slot(
        slot, boost::asio::bind_executor(
                  executor,
                  [this, direction, buffers, handler = std::move(handler)](
                      boost::system::error_code ec, std::size_t n) mutable {
                    if (trace_) {
                      std::string bytes(n, '\0');
                      boost::asio::buffer_copy(
                          boost::asio::buffer(bytes), buffers, n);
                      log_transfer(direction, ec, bytes);
                    }
                    std::move(handler)(ec, n);
                  }));
  }

  void log_transfer(
      std::string_view direction, const boost::system::error_code& ec,
      std::string_view bytes) const;

  boost::asio::readable_pipe in_;
  boost::asio::writable_pipe out_;
  bool trace_{};
};

}  // namespace drillsp
