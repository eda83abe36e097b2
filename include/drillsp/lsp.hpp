// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file lsp.hpp
 * @brief The handful of Language Server Protocol structures we speak.
 *
 * Only what the handshake, didOpen and documentSymbol need, plus the
 * show/log message notifications a server sends on its own.
 */

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace drillsp {

namespace fs = std::filesystem;

enum class symbol_kind : int {
  file = 1,
  module,
  namespace_,
  package,
  class_,
  method,
  property,
  field,
  constructor,
  enum_,
  interface,
  function,
  variable,
  constant,
  string,
  number,
  boolean,
  array,
  object,
  key,
  null,
  enum_member,
  struct_,
  event,
  operator_,
  type_parameter,
};

// Severity of window/showMessage and window/logMessage.  A value outside
// this set is a decode error, not a new severity.
enum class message_type : int { error = 1, warning, info, log, debug };

struct position {
  int line{};
  int character{};
};

struct symbol_information {
  std::string name;
  symbol_kind kind{};
  std::string detail{};
  std::string container_name{};
  position start{};
};

struct text_document_item {
  std::string uri;
  std::string language_id;
  int version{1};
  std::string text;
};

struct initialize_params {
  std::string root_uri;
  std::optional<int> process_id{};
  std::string client_name{"drillsp"};
  std::string client_version{};
};

struct show_message_params {
  message_type type{};
  std::string message;
};

/// @c file:// URI for @p path, made absolute and percent-encoded.
std::string path_to_uri(const fs::path& path);

std::string_view message_type_name(message_type type);
std::string_view symbol_kind_name(symbol_kind kind);

boost::json::object initialize_params_to_json(const initialize_params& p);
boost::json::object did_open_params_to_json(const text_document_item& doc);
boost::json::object text_document_params(std::string_view uri);

/** @brief Symbols from a textDocument/documentSymbol result.
 *
 * Accepts both flat @c SymbolInformation[] and hierarchical
 * @c DocumentSymbol[] results.  Hierarchies are flattened in pre-order
 * and children record their parent's name as @c container_name.  A null
 * result means no symbols.  Throws @c decode_error on anything else.
 */
std::vector<symbol_information> parse_document_symbols(
    const boost::json::value& result);

/** @brief Params of window/showMessage or window/logMessage.
 *
 * Throws @c decode_error, including for an unknown severity.
 */
show_message_params parse_show_message(const boost::json::value& params);

}  // namespace drillsp
