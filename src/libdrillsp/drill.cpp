// SPDX-License-Identifier: MIT
#include "drillsp/drill.hpp"

#include <fmt/std.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <exception>
#include <fstream>
#include <iterator>
#include <utility>

#include "drillsp/connection.hpp"
#include "drillsp/handler.hpp"
#include "drillsp/lsp_client.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace asio = boost::asio;

namespace {

std::string slurp(const fs::path& file) {
  std::ifstream in{file, std::ios::binary};
  if (!in) utils::throwf("Can't read {}", file);
  return std::string{
    std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>()};
}

asio::awaitable<std::vector<symbol_information>> drill(
    connection& conn, const drill_options& opts, std::string text) {
  lsp_client client{conn, opts.timeout};

  auto root{opts.root ? *opts.root : fs::absolute(opts.file).parent_path()};
  LOG_DEBUG("Workspace root is {}", root);
  co_await client.initialize(
      {.root_uri = path_to_uri(root), .process_id = ::getpid()});
  co_await client.initialized();

  auto uri{path_to_uri(opts.file)};
  co_await client.did_open(
      {.uri = uri, .language_id = opts.language_id, .text = std::move(text)});
  auto symbols{co_await client.document_symbols(uri)};

  co_await client.shutdown();
  co_return symbols;
}

}  // namespace

std::vector<symbol_information> fetch_document_symbols(
    const drill_options& opts) {
  auto text{opts.text ? *opts.text : slurp(opts.file)};

  asio::io_context ctx;
  auto server{launch_server(ctx.get_executor(), opts.server)};
  lsp_message_handler handler;
  connection conn{server->take_stream(), handler};

  asio::co_spawn(ctx, conn.run(), asio::detached);

  std::vector<symbol_information> symbols;
  std::exception_ptr failure;
  asio::co_spawn(
      ctx, drill(conn, opts, std::move(text)),
      [&](std::exception_ptr e, std::vector<symbol_information> result) {
        if (e)
          failure = e;
        else
          symbols = std::move(result);
        conn.close();
        server->stop(opts.grace);
      });
  ctx.run();

  if (failure) std::rethrow_exception(failure);
  return symbols;
}

std::vector<std::string> function_names(
    const std::vector<symbol_information>& symbols) {
  std::vector<std::string> names;
  for (const auto& s : symbols)
    if (s.kind == symbol_kind::function) names.push_back(s.name);
  return names;
}

}  // namespace drillsp
