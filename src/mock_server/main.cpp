// SPDX-License-Identifier: MIT
//
// A scripted language server for the tests.  Speaks just enough LSP over
// stdio for a drill session: initialize, didOpen, documentSymbol,
// shutdown and exit.  Symbols are found with a couple of regexps over
// the opened text.

#include <re2/re2.h>
#include <unistd.h>

#include <CLI/CLI.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/json.hpp>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <variant>
#include <vector>

#include "../libdrillsp/logger.hpp"
#include "drillsp/jsonrpc.hpp"
#include "drillsp/message.hpp"
#include "drillsp/pipe_stream.hpp"

namespace asio = boost::asio;
namespace json = boost::json;
namespace dl = drillsp;

namespace {

struct script {
  bool fail_initialize{false};
  std::optional<int> show_message_type{};
  bool ask_configuration{false};
  std::string exit_on{};
};

struct session {
  script how;
  std::map<std::string, std::string> documents{};
  bool done{false};
};

json::object range_at(int line, int character, int length) {
  json::object start;
  start["line"] = line;
  start["character"] = character;
  json::object end;
  end["line"] = line;
  end["character"] = character + length;
  json::object range;
  range["start"] = std::move(start);
  range["end"] = std::move(end);
  return range;
}

json::array find_symbols(const std::string& uri, const std::string& text) {
  static const RE2 func_re{R"(^func\s+(\w+)\s*\()"};
  static const RE2 method_re{R"(^func\s+\([^)]*\)\s*(\w+)\s*\()"};
  static const RE2 struct_re{R"(^type\s+(\w+)\s+struct\b)"};

  json::array symbols;
  std::istringstream lines{text};
  int lineno{0};
  for (std::string line; std::getline(lines, line); ++lineno) {
    std::string name;
    int kind{};
    if (RE2::PartialMatch(line, func_re, &name))
      kind = 12;
    else if (RE2::PartialMatch(line, method_re, &name))
      kind = 6;
    else if (RE2::PartialMatch(line, struct_re, &name))
      kind = 23;
    else
      continue;

    json::object location;
    location["uri"] = uri;
    location["range"] =
        range_at(lineno, static_cast<int>(line.find(name)),
                 static_cast<int>(name.size()));
    json::object sym;
    sym["name"] = name;
    sym["kind"] = kind;
    sym["location"] = std::move(location);
    symbols.push_back(std::move(sym));
  }
  return symbols;
}

std::string text_document_uri(const json::value& params) {
  const auto* td{params.as_object().if_contains("textDocument")};
  if (!td || !td->is_object()) return {};
  const auto* uri{td->as_object().if_contains("uri")};
  return uri && uri->is_string() ? std::string{uri->get_string()} : "";
}

std::optional<dl::message> on_call(session& s, const dl::call_message& c) {
  if (c.method == s.how.exit_on) {
    LOG_INFO("mock: dying on {}", c.method);
    std::exit(3);
  }
  if (c.method == "initialize") {
    if (s.how.fail_initialize)
      return dl::make_error(
          c.id, dl::rpc_errc::internal_error, "initialize refused");
    json::object capabilities;
    capabilities["documentSymbolProvider"] = true;
    capabilities["textDocumentSync"] = 1;
    json::object server_info;
    server_info["name"] = "drillsp-mock";
    server_info["version"] = "0.1.0";
    json::object result;
    result["capabilities"] = std::move(capabilities);
    result["serverInfo"] = std::move(server_info);
    return dl::make_result(c.id, std::move(result));
  }
  if (c.method == "textDocument/documentSymbol") {
    auto uri{text_document_uri(c.params)};
    auto it{s.documents.find(uri)};
    if (it == s.documents.end())
      return dl::make_error(
          c.id, dl::rpc_errc::invalid_params, "document not open",
          json::value(uri));
    return dl::make_result(c.id, find_symbols(uri, it->second));
  }
  if (c.method == "shutdown") return dl::make_result(c.id, nullptr);
  return dl::make_error(
      c.id, dl::rpc_errc::method_not_found, "Method not found",
      json::value(c.method));
}

std::vector<dl::message> on_notification(
    session& s, const dl::notification_message& n) {
  std::vector<dl::message> out;
  if (n.method == s.how.exit_on) {
    LOG_INFO("mock: dying on {}", n.method);
    std::exit(3);
  }
  if (n.method == "initialized") {
    if (s.how.show_message_type) {
      json::object params;
      params["type"] = *s.how.show_message_type;
      params["message"] = "mock server ready";
      out.emplace_back(dl::notification_message{
        .method = "window/showMessage", .params = std::move(params)});
    }
    if (s.how.ask_configuration) {
      json::object item;
      item["section"] = "gopls";
      json::array items;
      items.push_back(std::move(item));
      json::object params;
      params["items"] = std::move(items);
      out.emplace_back(dl::call_message{
        .id = std::string{"cfg-1"},
        .method = "workspace/configuration",
        .params = std::move(params)});
    }
  } else if (n.method == "textDocument/didOpen") {
    const auto& td{n.params.as_object().at("textDocument").as_object()};
    s.documents[std::string{td.at("uri").as_string()}] =
        std::string{td.at("text").as_string()};
  } else if (n.method == "textDocument/didClose") {
    s.documents.erase(text_document_uri(n.params));
  } else if (n.method == "exit") {
    s.done = true;
  }
  return out;
}

asio::awaitable<void> server_loop(script how) {
  auto executor{co_await asio::this_coro::executor};

  // Duplicate stdin/stdout to allow async operations
  dl::pipe_stream stream{
    asio::readable_pipe{executor, ::dup(STDIN_FILENO)},
    asio::writable_pipe{executor, ::dup(STDOUT_FILENO)}};
  std::string pending;
  session s{.how = std::move(how)};

  while (!s.done) {
    auto text{co_await dl::read_jsonrpc_message(stream, pending)};
    if (!text) break;  // EOF

    std::vector<dl::message> out;
    try {
      auto msg{dl::decode_message(*text)};
      if (const auto* c{std::get_if<dl::call_message>(&msg)}) {
        if (auto reply{on_call(s, *c)}) out.push_back(std::move(*reply));
      } else if (const auto* n{std::get_if<dl::notification_message>(&msg)}) {
        out = on_notification(s, *n);
      } else {
        const auto& r{std::get<dl::response_message>(msg)};
        LOG_INFO(
            "mock: client answered {}: {}", dl::to_string(r.id),
            r.error ? r.error->message : json::serialize(r.result));
      }
    } catch (const std::exception& e) {
      out.emplace_back(dl::make_error(
          nullptr, dl::rpc_errc::parse_error, "Parse error",
          json::value(e.what())));
    }

    for (const auto& m : out)
      co_await dl::write_jsonrpc_message(stream, dl::encode_message(m));
  }
  LOG_INFO("mock: done");
}

}  // namespace

int main(int argc, char* argv[]) {
  script how;
  int loglevel{2};

  CLI::App app{"Scripted language server for tests"};
  app.add_option("-d,--debug", loglevel, "Debug log level")
    ->capture_default_str();
  app.add_flag(
      "--fail-initialize", how.fail_initialize,
      "Answer initialize with an error");
  app.add_option(
      "--show-message-type", how.show_message_type,
      "After initialized, send window/showMessage with this type");
  app.add_flag(
      "--ask-configuration", how.ask_configuration,
      "After initialized, send a workspace/configuration request");
  app.add_option(
      "--exit-on", how.exit_on,
      "Exit abruptly when this method arrives");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }
  drillsp::logger::set_level(static_cast<drillsp::logger::level>(loglevel));

  try {
    asio::io_context ctx;
    asio::co_spawn(
        ctx, server_loop(std::move(how)), [](std::exception_ptr e) {
          if (e) std::rethrow_exception(e);
        });
    ctx.run();
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
  }
}
