#include <doctest/doctest.h>

#include <chrono>
#include <string>
#include <vector>

#include "../test_helpers.hpp"
#include "drillsp/errors.hpp"
#include "drillsp/handler.hpp"
#include "drillsp/lsp_client.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace dl = drillsp;

using namespace std::chrono_literals;
using dl::test::coro_runner;
using dl::test::make_loopback;
using dl::test::scripted_peer;

namespace {

const char* const uri{"file:///tmp/a.go"};

json::value hierarchical_symbols() {
  return json::parse(R"([
    {"name": "T", "kind": 23,
     "range": {"start": {"line": 0, "character": 0},
               "end": {"line": 0, "character": 16}},
     "selectionRange": {"start": {"line": 0, "character": 5},
                        "end": {"line": 0, "character": 6}},
     "children": [
       {"name": "M", "kind": 6,
        "range": {"start": {"line": 1, "character": 0},
                  "end": {"line": 1, "character": 18}},
        "selectionRange": {"start": {"line": 1, "character": 11},
                           "end": {"line": 1, "character": 12}}}]},
    {"name": "F", "kind": 12,
     "range": {"start": {"line": 2, "character": 0},
               "end": {"line": 2, "character": 10}},
     "selectionRange": {"start": {"line": 2, "character": 5},
                        "end": {"line": 2, "character": 6}}}
  ])");
}

// A well-behaved server, checking what the client sends along the way.
asio::awaitable<void> play_server(scripted_peer& peer) {
  auto init{co_await peer.next_call()};
  CHECK(init.method == "initialize");
  const auto& params{init.params.as_object()};
  CHECK(params.at("rootUri").as_string() == "file:///tmp");
  CHECK(params.contains("capabilities"));
  co_await peer.send(dl::make_result(
      init.id, json::object{{"capabilities", json::object{}}}));

  auto initialized{co_await peer.next_notification()};
  CHECK(initialized.method == "initialized");
  CHECK(initialized.params == json::value(json::object{}));

  auto opened{co_await peer.next_notification()};
  CHECK(opened.method == "textDocument/didOpen");
  const auto& doc{opened.params.as_object().at("textDocument").as_object()};
  CHECK(doc.at("uri").as_string() == uri);
  CHECK(doc.at("languageId").as_string() == "go");
  CHECK(doc.at("version").as_int64() == 1);

  auto symbols{co_await peer.next_call()};
  CHECK(symbols.method == "textDocument/documentSymbol");
  co_await peer.send(dl::make_result(symbols.id, hierarchical_symbols()));

  auto closing{co_await peer.next_notification()};
  CHECK(closing.method == "textDocument/didClose");

  auto stop{co_await peer.next_call()};
  CHECK(stop.method == "shutdown");
  co_await peer.send(dl::make_result(stop.id, nullptr));

  auto bye{co_await peer.next_notification()};
  CHECK(bye.method == "exit");
  co_await peer.drain();
}

asio::awaitable<void> run_session(
    dl::connection& conn, std::vector<dl::symbol_information>& symbols) {
  dl::lsp_client client{conn, 5s};
  CHECK(client.current_state() == dl::lsp_client::state::uninitialized);

  auto result{co_await client.initialize({.root_uri = "file:///tmp"})};
  CHECK(result.as_object().contains("capabilities"));
  CHECK(client.current_state() == dl::lsp_client::state::initializing);

  co_await client.initialized();
  CHECK(client.current_state() == dl::lsp_client::state::ready);

  co_await client.did_open(
      {.uri = uri, .language_id = "go", .text = "type T struct{}\n"});
  CHECK(client.is_open(uri));

  symbols = co_await client.document_symbols(uri);

  co_await client.did_close(uri);
  CHECK_FALSE(client.is_open(uri));

  co_await client.shutdown();
  CHECK(client.current_state() == dl::lsp_client::state::shut_down);
  conn.close();
}

asio::awaitable<void> refuse_initialize(scripted_peer& peer) {
  auto init{co_await peer.next_call()};
  co_await peer.send(dl::make_error(
      init.id, dl::rpc_errc::internal_error, "not today"));
  co_await peer.drain();
}

asio::awaitable<void> failed_initialize(dl::connection& conn) {
  dl::lsp_client client{conn};
  bool refused{false};
  try {
    co_await client.initialize({.root_uri = "file:///tmp"});
  } catch (const dl::remote_error& e) {
    refused = true;
    CHECK(std::string{e.what()} == "not today");
  }
  CHECK(refused);
  CHECK(client.current_state() == dl::lsp_client::state::uninitialized);

  // Nothing else may follow a failed initialize
  bool rejected{false};
  try {
    co_await client.initialized();
  } catch (const dl::sequence_error&) {
    rejected = true;
  }
  CHECK(rejected);
  conn.close();
}

asio::awaitable<void> out_of_order(dl::connection& conn, int& rejections) {
  dl::lsp_client client{conn};
  try {
    co_await client.did_open({.uri = uri, .language_id = "go", .text = ""});
  } catch (const dl::sequence_error&) {
    ++rejections;
  }
  try {
    co_await client.document_symbols(uri);
  } catch (const dl::sequence_error&) {
    ++rejections;
  }
  try {
    co_await client.shutdown();
  } catch (const dl::sequence_error&) {
    ++rejections;
  }
  try {
    co_await client.initialized();
  } catch (const dl::sequence_error&) {
    ++rejections;
  }
  CHECK(client.current_state() == dl::lsp_client::state::uninitialized);
  conn.close();
}

asio::awaitable<void> expect_silence(scripted_peer& peer, bool& silent) {
  auto msg{co_await peer.next()};
  silent = !msg.has_value();
  peer.stream.close();
}

// Try initialized while the initialize reply is still owed.
asio::awaitable<void> hold_initialize(
    scripted_peer& peer, dl::lsp_client& client, bool& rejected) {
  auto init{co_await peer.next_call()};
  try {
    co_await client.initialized();
  } catch (const dl::sequence_error&) {
    rejected = true;
  }
  co_await peer.send(dl::make_result(
      init.id, json::object{{"capabilities", json::object{}}}));
  co_await peer.drain();
}

asio::awaitable<void> initialize_then_initialized(
    dl::connection& conn, dl::lsp_client& client) {
  co_await client.initialize({.root_uri = "file:///tmp"});
  co_await client.initialized();
  CHECK(client.current_state() == dl::lsp_client::state::ready);
  conn.close();
}

}  // namespace

TEST_CASE("full LSP session") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  dl::lsp_message_handler handler;
  dl::connection conn{std::move(pipes.client), handler};
  scripted_peer peer{std::move(pipes.peer)};
  std::vector<dl::symbol_information> symbols;

  coro_runner runner{ctx};
  runner.spawn(conn.run());
  runner.spawn(play_server(peer));
  runner.spawn(run_session(conn, symbols));
  runner.run();

  REQUIRE(symbols.size() == 3);
  CHECK(symbols[0].name == "T");
  CHECK(symbols[1].name == "M");
  CHECK(symbols[1].container_name == "T");
  CHECK(symbols[2].name == "F");
  CHECK(symbols[2].kind == dl::symbol_kind::function);
}

TEST_CASE("a refused initialize leaves the client uninitialized") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  dl::lsp_message_handler handler;
  dl::connection conn{std::move(pipes.client), handler};
  scripted_peer peer{std::move(pipes.peer)};

  coro_runner runner{ctx};
  runner.spawn(conn.run());
  runner.spawn(refuse_initialize(peer));
  runner.spawn(failed_initialize(conn));
  runner.run();
}

TEST_CASE("operations out of order write nothing") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  dl::lsp_message_handler handler;
  dl::connection conn{std::move(pipes.client), handler};
  scripted_peer peer{std::move(pipes.peer)};
  int rejections{0};
  bool silent{false};

  coro_runner runner{ctx};
  runner.spawn(conn.run());
  runner.spawn(expect_silence(peer, silent));
  runner.spawn(out_of_order(conn, rejections));
  runner.run();

  CHECK(rejections == 4);
  CHECK(silent);
}

TEST_CASE("initialized waits for the initialize reply") {
  asio::io_context ctx;
  auto pipes{make_loopback(ctx)};
  dl::lsp_message_handler handler;
  dl::connection conn{std::move(pipes.client), handler};
  scripted_peer peer{std::move(pipes.peer)};
  dl::lsp_client client{conn, 5s};
  bool rejected{false};

  coro_runner runner{ctx};
  runner.spawn(conn.run());
  runner.spawn(hold_initialize(peer, client, rejected));
  runner.spawn(initialize_then_initialized(conn, client));
  runner.run();

  CHECK(rejected);
}
