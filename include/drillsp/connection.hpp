// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file connection.hpp
 * @brief A bidirectional JSONRPC 2.0 endpoint over a @c pipe_stream.
 *
 * One coroutine, @c run(), drains the inbound stream for the lifetime of
 * the connection.  Responses are matched to outstanding calls by id,
 * everything the peer initiates goes to a @c notification_handler.  Any
 * number of @c call() and @c notify() coroutines may be in flight
 * concurrently; outbound frames are written whole, one at a time.
 *
 * Typical use:
 *
 *   drillsp::connection conn{std::move(stream), handler};
 *   asio::co_spawn(ctx, conn.run(), asio::detached);
 *   auto result = co_await conn.call("initialize", params, 10s);
 */

#include <boost/asio/awaitable.hpp>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/json.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "drillsp/handler.hpp"
#include "drillsp/message.hpp"
#include "drillsp/pipe_stream.hpp"

namespace drillsp {

class connection {
 public:
  using duration = std::chrono::steady_clock::duration;

  /// @p handler must outlive the connection.
  connection(pipe_stream stream, notification_handler& handler);

  connection(const connection&) = delete;
  connection& operator=(const connection&) = delete;
  ~connection() = default;

  /** @brief Call @p method and wait for the peer's answer.
   *
   * Throws @c remote_error if the peer answers with an error object,
   * @c cancelled_error if @p timeout elapses or the awaiting coroutine
   * is cancelled first, and @c connection_closed_error if the connection
   * is or becomes unusable.  A cancelled call is not retracted: its late
   * response is dropped.
   */
  boost::asio::awaitable<boost::json::value> call(
      std::string method, boost::json::value params = {},
      std::optional<duration> timeout = std::nullopt);

  /// Send a notification.  Completes once the frame is written.
  boost::asio::awaitable<void> notify(
      std::string method, boost::json::value params = {});

  /** @brief The dispatch loop.  Spawn exactly once.
   *
   * Returns when the inbound stream ends, fails, or carries a malformed
   * message, or when @c close() is called.  Every call still waiting at
   * that point fails with @c connection_closed_error.
   */
  boost::asio::awaitable<void> run();

  /// Close both pipes and fail whatever is still outstanding.
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t outstanding() const;

 private:
  struct pending_request {
    pending_request(const boost::asio::any_io_executor& ex, std::string m)
        : method{std::move(m)}, slot{ex, 1} {}
    std::string method;
    boost::asio::experimental::concurrent_channel<void(
        boost::system::error_code, std::exception_ptr, boost::json::value)>
        slot;
  };

  boost::asio::awaitable<void> send(boost::json::object msg);
  void on_response(response_message resp);
  void on_call(call_message call);
  void on_notification(const notification_message& note);
  bool forget(std::int64_t id);
  void fail_all(const std::string& reason);

  pipe_stream stream_;
  notification_handler* handler_;
  std::string inbound_;

  // Capacity-1 channel used as an async mutex around whole-frame writes
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code)>
      write_lock_;

  mutable std::mutex mutex_;
  std::int64_t next_id_{1};
  std::map<std::int64_t, std::shared_ptr<pending_request>> pending_;
  bool closed_{};
  std::string close_reason_;
};

}  // namespace drillsp
