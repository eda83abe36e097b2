// SPDX-License-Identifier: MIT
#include "drillsp/handler.hpp"

#include <string>

#include "drillsp/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace json = boost::json;

std::optional<json::value> lsp_message_handler::handle(
    std::string_view method, const std::optional<request_id>& id,
    const json::value& params) {
  try {
    if (method == "window/showMessage" || method == "window/logMessage") {
      on_message(method, id, params);
      return std::nullopt;
    }
    if (method == "window/showMessageRequest") {
      // Nobody is there to pick an action
      on_message(method, id, params);
      return json::value(nullptr);
    }
    if (method == "textDocument/publishDiagnostics") {
      on_diagnostics(params);
      return std::nullopt;
    }
    if (method == "window/workDoneProgress/create" ||
        method == "client/registerCapability" ||
        method == "client/unregisterCapability") {
      return json::value(nullptr);
    }
    if (method == "workspace/configuration") {
      // No settings of our own: one null per requested section
      json::array answers;
      if (const auto* obj{params.if_object()}) {
        if (const auto* items{obj->if_contains("items")};
            items && items->is_array())
          answers.resize(items->get_array().size());
      }
      return json::value(std::move(answers));
    }
  } catch (const decode_error& e) {
    LOG_WARN("Ignoring malformed {}: {}", method, e.what());
    return std::nullopt;
  }

  LOG_DEBUG(
      "Unhandled server {} {}", id ? "request" : "notification", method);
  return std::nullopt;
}

void lsp_message_handler::on_message(
    std::string_view method, const std::optional<request_id>& id,
    const json::value& params) {
  auto msg{parse_show_message(params)};
  std::string id_str{id ? to_string(*id) : ""};
  auto prefix{message_type_name(msg.type)};

  switch (msg.type) {
    case message_type::error:
      LOG_ERROR(
          "Server notification {} {} {}: {}", method, id_str, prefix,
          msg.message);
      break;
    case message_type::warning:
      LOG_WARN(
          "Server notification {} {} {}: {}", method, id_str, prefix,
          msg.message);
      break;
    case message_type::info:
      LOG_INFO(
          "Server notification {} {} {}: {}", method, id_str, prefix,
          msg.message);
      break;
    case message_type::log:
    case message_type::debug:
      LOG_DEBUG(
          "Server notification {} {} {}: {}", method, id_str, prefix,
          msg.message);
      break;
  }
  shown_.push_back(std::move(msg));
}

void lsp_message_handler::on_diagnostics(const json::value& params) {
  const auto* obj{params.if_object()};
  if (!obj) utils::throwf<decode_error>("diagnostics params not an object");

  std::string uri;
  if (const auto* u{obj->if_contains("uri")}; u && u->is_string())
    uri = u->get_string();
  std::size_t count{};
  if (const auto* d{obj->if_contains("diagnostics")}; d && d->is_array())
    count = d->get_array().size();
  LOG_DEBUG("{} diagnostics for {}", count, uri);
}

}  // namespace drillsp
