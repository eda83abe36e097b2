// SPDX-License-Identifier: MIT
#include "drillsp/connection.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/experimental/awaitable_operators.hpp>
#include <boost/asio/experimental/channel_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>
#include <tuple>
#include <utility>
#include <variant>

#include "drillsp/errors.hpp"
#include "drillsp/jsonrpc.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace asio = boost::asio;
namespace json = boost::json;
namespace sys = boost::system;

using utils::throwf;

namespace {

using lock_channel =
    asio::experimental::concurrent_channel<void(sys::error_code)>;

// Holds the connection's write lock until destroyed
class write_permit {
 public:
  explicit write_permit(lock_channel& lock) : lock_{&lock} {}
  write_permit(const write_permit&) = delete;
  write_permit& operator=(const write_permit&) = delete;
  ~write_permit() { lock_->try_receive([](sys::error_code) {}); }

 private:
  lock_channel* lock_;
};

// Timers and pipes abort, channels report their own code
bool is_cancellation(const sys::error_code& ec) {
  return ec == asio::error::operation_aborted ||
         ec == asio::experimental::error::channel_cancelled;
}

}  // namespace

connection::connection(pipe_stream stream, notification_handler& handler)
    : stream_{std::move(stream)},
      handler_{&handler},
      write_lock_{stream_.get_executor(), 1} {}

bool connection::closed() const {
  std::scoped_lock lock{mutex_};
  return closed_;
}

std::size_t connection::outstanding() const {
  std::scoped_lock lock{mutex_};
  return pending_.size();
}

bool connection::forget(std::int64_t id) {
  std::scoped_lock lock{mutex_};
  return pending_.erase(id) > 0;
}

asio::awaitable<json::value> connection::call(
    std::string method, json::value params, std::optional<duration> timeout) {
  using namespace asio::experimental::awaitable_operators;

  auto executor{co_await asio::this_coro::executor};
  auto pending{std::make_shared<pending_request>(executor, method)};
  std::int64_t id{};
  {
    std::scoped_lock lock{mutex_};
    if (closed_)
      throwf<connection_closed_error>(
          "Can't call {}: {}", method, close_reason_);
    id = next_id_++;
    pending_.emplace(id, pending);
  }

  std::tuple<std::exception_ptr, json::value> outcome;
  bool timed_out{false};
  try {
    co_await send(encode_message(
        call_message{.id = id, .method = method, .params = std::move(params)}));

    if (timeout) {
      asio::steady_timer timer{executor, *timeout};
      auto winner{co_await (
          pending->slot.async_receive(asio::use_awaitable) ||
          timer.async_wait(asio::use_awaitable))};
      if (winner.index() == 0)
        outcome = std::get<0>(std::move(winner));
      else
        timed_out = true;
    } else {
      outcome = co_await pending->slot.async_receive(asio::use_awaitable);
    }
  } catch (const sys::system_error& e) {
    forget(id);
    if (is_cancellation(e.code()))
      throwf<cancelled_error>("{} (id {}) cancelled", method, id);
    throw;
  } catch (const std::exception&) {
    forget(id);
    throw;
  }

  if (timed_out) {
    forget(id);
    throwf<cancelled_error>(
        "{} (id {}) timed out after {}ms", method, id,
        std::chrono::duration_cast<std::chrono::milliseconds>(*timeout)
            .count());
  }

  auto& [error, result] = outcome;
  if (error) std::rethrow_exception(error);
  co_return std::move(result);
}

asio::awaitable<void> connection::notify(
    std::string method, json::value params) {
  {
    std::scoped_lock lock{mutex_};
    if (closed_)
      throwf<connection_closed_error>(
          "Can't notify {}: {}", method, close_reason_);
  }
  co_await send(encode_message(notification_message{
    .method = std::move(method), .params = std::move(params)}));
}

asio::awaitable<void> connection::send(json::object msg) {
  try {
    co_await write_lock_.async_send(sys::error_code{}, asio::use_awaitable);
  } catch (const sys::system_error& e) {
    if (is_cancellation(e.code()))
      throwf<cancelled_error>("Cancelled waiting to write");
    throw;
  }
  write_permit permit{write_lock_};

  LOG_DEBUG("-> {}", utils::elide(json::serialize(msg)));
  try {
    co_await write_jsonrpc_message(stream_, msg);
  } catch (const sys::system_error& e) {
    if (is_cancellation(e.code()) && !closed())
      throwf<cancelled_error>("Write cancelled: {}", e.code().message());
    throwf<connection_closed_error>("Write failed: {}", e.code().message());
  }
}

asio::awaitable<void> connection::run() {
  std::string reason{"Server closed its output"};
  try {
    for (;;) {
      auto text{co_await read_jsonrpc_message(stream_, inbound_)};
      if (!text) break;
      LOG_DEBUG("<- {}", utils::elide(*text));

      auto msg{decode_message(*text)};
      if (auto* resp{std::get_if<response_message>(&msg)})
        on_response(std::move(*resp));
      else if (auto* peer_call{std::get_if<call_message>(&msg)})
        on_call(std::move(*peer_call));
      else
        on_notification(std::get<notification_message>(msg));
    }
  } catch (const decode_error& e) {
    LOG_ERROR("Malformed message, giving up: {}", e.what());
    reason = fmt::format("Malformed message: {}", e.what());
  } catch (const sys::system_error& e) {
    if (e.code() == asio::error::operation_aborted) {
      reason = "Connection closed";
    } else {
      LOG_ERROR("Read failed: {}", e.code().message());
      reason = fmt::format("Read failed: {}", e.code().message());
    }
  }
  LOG_DEBUG("Dispatch loop done: {}", reason);
  stream_.close();
  fail_all(reason);
}

void connection::close() {
  LOG_DEBUG("Closing connection with {} outstanding", outstanding());
  stream_.close();
  fail_all("Connection closed");
}

void connection::on_response(response_message resp) {
  std::shared_ptr<pending_request> pending;
  if (const auto* id{std::get_if<std::int64_t>(&resp.id)}) {
    std::scoped_lock lock{mutex_};
    if (auto it{pending_.find(*id)}; it != pending_.end()) {
      pending = std::move(it->second);
      pending_.erase(it);
    }
  }
  if (!pending) {
    LOG_WARN("Dropping response to unknown id {}", to_string(resp.id));
    return;
  }

  bool delivered{};
  if (resp.error) {
    delivered = pending->slot.try_send(
        sys::error_code{},
        std::make_exception_ptr(remote_error{
          resp.error->code, resp.error->message,
          std::move(resp.error->data)}),
        json::value{});
  } else {
    delivered = pending->slot.try_send(
        sys::error_code{}, std::exception_ptr{}, std::move(resp.result));
  }
  if (!delivered)
    LOG_WARN("Response to {} arrived twice", to_string(resp.id));
}

void connection::on_call(call_message call) {
  response_message reply;
  try {
    if (auto result{handler_->handle(call.method, call.id, call.params)})
      reply = make_result(call.id, std::move(*result));
    else
      reply = make_error(
          call.id, rpc_errc::method_not_found, "Method not found",
          json::value(call.method));
  } catch (const std::exception& e) {
    LOG_ERROR("Handler failed on {}: {}", call.method, e.what());
    reply = make_error(
        call.id, rpc_errc::internal_error, "Internal error",
        json::value(e.what()));
  }

  // Answer on the side so a slow write never stalls the reader
  asio::co_spawn(
      stream_.get_executor(), send(encode_message(reply)),
      [method = std::move(call.method)](std::exception_ptr e) {
        if (!e) return;
        try {
          std::rethrow_exception(e);
        } catch (const std::exception& ex) {
          LOG_WARN("Couldn't answer {}: {}", method, ex.what());
        }
      });
}

void connection::on_notification(const notification_message& note) {
  try {
    handler_->handle(note.method, std::nullopt, note.params);
  } catch (const std::exception& e) {
    LOG_ERROR("Handler failed on {}: {}", note.method, e.what());
  }
}

void connection::fail_all(const std::string& reason) {
  std::map<std::int64_t, std::shared_ptr<pending_request>> doomed;
  {
    std::scoped_lock lock{mutex_};
    if (!closed_) {
      closed_ = true;
      close_reason_ = reason;
    }
    doomed.swap(pending_);
  }
  for (auto& [id, pending] : doomed) {
    LOG_DEBUG("Failing call {}: {}", id, reason);
    auto error{fmt::format("{} (id {}): {}", pending->method, id, reason)};
    if (!pending->slot.try_send(
            sys::error_code{},
            std::make_exception_ptr(connection_closed_error{error}),
            json::value{}))
      LOG_WARN("Call {} already had an answer", id);
  }
}

}  // namespace drillsp
