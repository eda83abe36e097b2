// SPDX-License-Identifier: MIT
#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "drillsp/connection.hpp"
#include "drillsp/lsp.hpp"

namespace drillsp {

/** @brief Drives the LSP lifecycle over a @c connection.
 *
 * Enforces the order initialize, initialized, document traffic,
 * shutdown.  An operation issued in the wrong state throws
 * @c sequence_error before anything is written.  Every call is bounded
 * by the timeout given at construction, if any.
 */
class lsp_client {
 public:
  enum class state { uninitialized, initializing, ready, shut_down };

  explicit lsp_client(
      connection& conn,
      std::optional<connection::duration> timeout = std::nullopt)
      : conn_{&conn}, timeout_{timeout} {}

  /// Returns the server's InitializeResult.  On failure the client is
  /// back to @c uninitialized.
  boost::asio::awaitable<boost::json::value> initialize(
      initialize_params params);
  boost::asio::awaitable<void> initialized();

  boost::asio::awaitable<void> did_open(text_document_item doc);
  boost::asio::awaitable<void> did_close(std::string uri);
  boost::asio::awaitable<std::vector<symbol_information>> document_symbols(
      std::string uri);

  /// shutdown, then exit.
  boost::asio::awaitable<void> shutdown();

  [[nodiscard]] state current_state() const { return state_; }
  [[nodiscard]] bool is_open(std::string_view uri) const;

 private:
  void require(state wanted, std::string_view operation) const;

  connection* conn_;
  std::optional<connection::duration> timeout_;
  state state_{state::uninitialized};
  bool initialize_answered_{};
  std::map<std::string, int, std::less<>> open_documents_;
};

std::string_view to_string(lsp_client::state s);

}  // namespace drillsp
