// SPDX-License-Identifier: MIT
#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "drillsp/lsp.hpp"
#include "drillsp/process.hpp"

namespace drillsp {

namespace fs = std::filesystem;

struct drill_options {
  fs::path file;
  // Document contents.  Read from @c file when empty.
  std::optional<std::string> text{};
  std::string language_id{"go"};
  // Workspace root.  Defaults to the file's directory.
  std::optional<fs::path> root{};
  server_command server{};
  std::chrono::milliseconds timeout{60000};
  // How long the server gets to exit on its own after the session
  std::chrono::milliseconds grace{2000};
};

/** @brief Ask a language server for the symbols of one document.
 *
 * Launches @c opts.server, performs the LSP handshake, opens the
 * document, asks for its symbols and shuts the server down politely.
 * Blocks until the server is gone.  Symbols come back in server order,
 * whatever their kind.  Any failure (@c launch_error, @c remote_error,
 * @c cancelled_error, @c connection_closed_error, ...) is rethrown here
 * after the connection is closed and the server stopped.
 */
std::vector<symbol_information> fetch_document_symbols(
    const drill_options& opts);

/// Names of the function symbols in @p symbols, in order.
std::vector<std::string> function_names(
    const std::vector<symbol_information>& symbols);

}  // namespace drillsp
