#include <doctest/doctest.h>

#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/write.hpp>
#include <chrono>
#include <string>

#include "drillsp/errors.hpp"
#include "drillsp/pipe_stream.hpp"
#include "test_helpers.hpp"

namespace asio = boost::asio;
namespace dl = drillsp;

using dl::test::coro_runner;
using dl::test::make_loopback;

namespace {

asio::awaitable<void> send_and_close(dl::pipe_stream& s, std::string bytes) {
  co_await asio::async_write(s, asio::buffer(bytes), asio::use_awaitable);
  s.close();
}

asio::awaitable<void> receive(dl::pipe_stream& s, std::string& into) {
  boost::system::error_code ec;
  co_await asio::async_read(
      s, asio::dynamic_buffer(into),
      asio::redirect_error(asio::use_awaitable, ec));
  CHECK(ec == asio::error::eof);
}

}  // namespace

TEST_CASE("socket-only operations throw") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  auto& s{pipes.client};

  CHECK_THROWS_AS(
      s.shutdown(asio::socket_base::shutdown_send), dl::unsupported_operation);
  CHECK_THROWS_AS(
      s.expires_after(std::chrono::seconds{1}), dl::unsupported_operation);
  CHECK_THROWS_AS(s.local_endpoint(), dl::unsupported_operation);
  CHECK_THROWS_AS(s.remote_endpoint(), dl::unsupported_operation);
  CHECK_THROWS_AS(s.shutdown(asio::socket_base::shutdown_both), std::logic_error);
  CHECK(s.is_open());
}

TEST_CASE("close shuts both directions") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  pipes.client.close();
  CHECK_FALSE(pipes.client.is_open());
  CHECK(pipes.peer.is_open());
}

TEST_CASE("tracing leaves the bytes alone") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  pipes.client.set_trace(true);
  pipes.peer.set_trace(true);
  CHECK(pipes.client.trace());

  std::string payload(10000, 'x');
  payload += "Content-Length: 2\r\n\r\n{}";
  std::string got;

  coro_runner runner{ctx};
  runner.spawn(send_and_close(pipes.peer, payload));
  runner.spawn(receive(pipes.client, got));
  runner.run();

  CHECK(got == payload);
}
