// SPDX-License-Identifier: MIT
#include "drillsp/lsp.hpp"

#include <fmt/format.h>

#include <array>
#include <cctype>
#include <utility>

#include "drillsp/errors.hpp"
#include "utils.hpp"

namespace drillsp {

namespace json = boost::json;

using utils::throwf;

namespace {

const json::object& expect_object(const json::value& v, std::string_view what) {
  const auto* obj{v.if_object()};
  if (!obj) throwf<decode_error>("{} is not an object", what);
  return *obj;
}

const json::value& member(const json::object& obj, std::string_view key) {
  const auto* v{obj.if_contains(key)};
  if (!v) throwf<decode_error>("missing member '{}'", key);
  return *v;
}

std::string expect_string(const json::object& obj, std::string_view key) {
  const auto* v{obj.if_contains(key)};
  if (!v || !v->is_string())
    throwf<decode_error>("missing string member '{}'", key);
  return std::string{v->get_string()};
}

int expect_int(const json::object& obj, std::string_view key) {
  const auto* v{obj.if_contains(key)};
  if (!v || !v->is_int64())
    throwf<decode_error>("missing integer member '{}'", key);
  return static_cast<int>(v->get_int64());
}

std::string optional_string(const json::object& obj, std::string_view key) {
  if (const auto* v{obj.if_contains(key)}; v && v->is_string())
    return std::string{v->get_string()};
  return {};
}

position parse_position(const json::value& v) {
  const auto& obj{expect_object(v, "position")};
  return {expect_int(obj, "line"), expect_int(obj, "character")};
}

position range_start(const json::value& range) {
  return parse_position(member(expect_object(range, "range"), "start"));
}

void flatten_document_symbol(
    const json::object& obj, const std::string& container,
    std::vector<symbol_information>& out) {
  symbol_information sym{};
  sym.name = expect_string(obj, "name");
  sym.kind = static_cast<symbol_kind>(expect_int(obj, "kind"));
  sym.detail = optional_string(obj, "detail");
  sym.container_name = container;
  if (const auto* sel{obj.if_contains("selectionRange")})
    sym.start = range_start(*sel);
  else if (const auto* range{obj.if_contains("range")})
    sym.start = range_start(*range);
  out.push_back(sym);

  if (const auto* children{obj.if_contains("children")};
      children && children->is_array()) {
    for (const auto& child : children->get_array())
      flatten_document_symbol(
          expect_object(child, "DocumentSymbol"), sym.name, out);
  }
}

}  // namespace

std::string path_to_uri(const fs::path& path) {
  std::string encoded{"file://"};
  for (unsigned char c : fs::absolute(path).lexically_normal().string()) {
    if (std::isalnum(c) || c == '/' || c == '-' || c == '.' || c == '_' ||
        c == '~')
      encoded += static_cast<char>(c);
    else
      encoded += fmt::format("%{:02X}", c);
  }
  return encoded;
}

std::string_view message_type_name(message_type type) {
  // clang-format off
  switch (type) {
  case message_type::error:   return "Error";
  case message_type::warning: return "Warning";
  case message_type::info:    return "Info";
  case message_type::log:     return "Log";
  case message_type::debug:   return "Debug";
  }
  // clang-format on
  return "Unknown";
}

std::string_view symbol_kind_name(symbol_kind kind) {
  static constexpr std::array<std::string_view, 26> names{
    "File",     "Module",      "Namespace", "Package",  "Class",
    "Method",   "Property",    "Field",     "Constructor", "Enum",
    "Interface", "Function",   "Variable",  "Constant", "String",
    "Number",   "Boolean",     "Array",     "Object",   "Key",
    "Null",     "EnumMember",  "Struct",    "Event",    "Operator",
    "TypeParameter"};
  auto index{static_cast<int>(kind) - 1};
  if (index < 0 || index >= static_cast<int>(names.size())) return "Unknown";
  return names[static_cast<std::size_t>(index)];
}

json::object initialize_params_to_json(const initialize_params& p) {
  json::object client_info;
  client_info["name"] = p.client_name;
  if (!p.client_version.empty()) client_info["version"] = p.client_version;

  json::object document_symbol;
  document_symbol["hierarchicalDocumentSymbolSupport"] = true;
  json::object text_document;
  text_document["documentSymbol"] = std::move(document_symbol);
  json::object capabilities;
  capabilities["textDocument"] = std::move(text_document);

  json::object folder;
  folder["uri"] = p.root_uri;
  folder["name"] = fs::path{p.root_uri}.filename().string();

  json::object params;
  if (p.process_id)
    params["processId"] = *p.process_id;
  else
    params["processId"] = nullptr;
  params["clientInfo"] = std::move(client_info);
  params["rootUri"] = p.root_uri;
  json::array folders;
  folders.push_back(std::move(folder));
  params["workspaceFolders"] = std::move(folders);
  params["capabilities"] = std::move(capabilities);
  return params;
}

json::object did_open_params_to_json(const text_document_item& doc) {
  json::object item;
  item["uri"] = doc.uri;
  item["languageId"] = doc.language_id;
  item["version"] = doc.version;
  item["text"] = doc.text;

  json::object params;
  params["textDocument"] = std::move(item);
  return params;
}

json::object text_document_params(std::string_view uri) {
  json::object identifier;
  identifier["uri"] = uri;
  json::object params;
  params["textDocument"] = std::move(identifier);
  return params;
}

std::vector<symbol_information> parse_document_symbols(
    const json::value& result) {
  std::vector<symbol_information> symbols;
  if (result.is_null()) return symbols;

  const auto* entries{result.if_array()};
  if (!entries)
    throwf<decode_error>(
        "documentSymbol result is not an array: {}",
        utils::elide(json::serialize(result), 80));

  for (const auto& entry : *entries) {
    const auto& obj{expect_object(entry, "symbol")};
    if (const auto* location{obj.if_contains("location")}) {
      // SymbolInformation
      symbol_information sym{};
      sym.name = expect_string(obj, "name");
      sym.kind = static_cast<symbol_kind>(expect_int(obj, "kind"));
      sym.container_name = optional_string(obj, "containerName");
      sym.start =
          range_start(member(expect_object(*location, "location"), "range"));
      symbols.push_back(std::move(sym));
    } else {
      flatten_document_symbol(obj, {}, symbols);
    }
  }
  return symbols;
}

show_message_params parse_show_message(const json::value& params) {
  const auto& obj{expect_object(params, "message params")};
  int type{expect_int(obj, "type")};
  if (type < static_cast<int>(message_type::error) ||
      type > static_cast<int>(message_type::debug))
    throwf<decode_error>("unexpected message type {}", type);
  return {static_cast<message_type>(type), expect_string(obj, "message")};
}

}  // namespace drillsp
