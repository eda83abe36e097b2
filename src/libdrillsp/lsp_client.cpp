// SPDX-License-Identifier: MIT
#include "drillsp/lsp_client.hpp"

#include <utility>

#include "drillsp/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace asio = boost::asio;
namespace json = boost::json;

std::string_view to_string(lsp_client::state s) {
  // clang-format off
  switch (s) {
  case lsp_client::state::uninitialized: return "uninitialized";
  case lsp_client::state::initializing:  return "initializing";
  case lsp_client::state::ready:         return "ready";
  case lsp_client::state::shut_down:     return "shut down";
  }
  // clang-format on
  return "unknown";
}

void lsp_client::require(state wanted, std::string_view operation) const {
  if (state_ != wanted)
    utils::throwf<sequence_error>(
        "{} needs a {} client, this one is {}", operation, to_string(wanted),
        to_string(state_));
}

bool lsp_client::is_open(std::string_view uri) const {
  return open_documents_.find(uri) != open_documents_.end();
}

asio::awaitable<json::value> lsp_client::initialize(initialize_params params) {
  require(state::uninitialized, "initialize");
  state_ = state::initializing;

  json::value result;
  try {
    result = co_await conn_->call(
        "initialize", initialize_params_to_json(params), timeout_);
  } catch (const std::exception& e) {
    LOG_ERROR("initialize failed: {}", e.what());
    state_ = state::uninitialized;
    throw;
  }
  initialize_answered_ = true;

  if (const auto* obj{result.if_object()}) {
    if (const auto* info{obj->if_contains("serverInfo")};
        info && info->is_object()) {
      LOG_INFO("Server is {}", utils::elide(json::serialize(*info), 120));
    }
  }
  co_return result;
}

asio::awaitable<void> lsp_client::initialized() {
  require(state::initializing, "initialized");
  if (!initialize_answered_)
    utils::throwf<sequence_error>(
        "initialized before the server answered initialize");
  co_await conn_->notify("initialized", json::object{});
  state_ = state::ready;
}

asio::awaitable<void> lsp_client::did_open(text_document_item doc) {
  require(state::ready, "didOpen");
  LOG_DEBUG("Opening {} ({} bytes)", doc.uri, doc.text.size());
  co_await conn_->notify("textDocument/didOpen", did_open_params_to_json(doc));
  open_documents_[doc.uri] = doc.version;
}

asio::awaitable<void> lsp_client::did_close(std::string uri) {
  require(state::ready, "didClose");
  if (!is_open(uri))
    utils::throwf<sequence_error>("didClose of {}, which isn't open", uri);
  co_await conn_->notify("textDocument/didClose", text_document_params(uri));
  open_documents_.erase(uri);
}

asio::awaitable<std::vector<symbol_information>> lsp_client::document_symbols(
    std::string uri) {
  require(state::ready, "documentSymbol");
  if (!is_open(uri))
    utils::throwf<sequence_error>(
        "documentSymbol of {}, which isn't open", uri);

  auto result{co_await conn_->call(
      "textDocument/documentSymbol", text_document_params(uri), timeout_)};
  auto symbols{parse_document_symbols(result)};
  LOG_DEBUG("{} symbols in {}", symbols.size(), uri);
  co_return symbols;
}

asio::awaitable<void> lsp_client::shutdown() {
  require(state::ready, "shutdown");
  co_await conn_->call("shutdown", nullptr, timeout_);
  state_ = state::shut_down;
  open_documents_.clear();
  co_await conn_->notify("exit");
}

}  // namespace drillsp
