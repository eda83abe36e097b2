// SPDX-License-Identifier: MIT
#include "drillsp/message.hpp"

#include <fmt/format.h>

#include <boost/system/error_code.hpp>
#include <limits>
#include <type_traits>
#include <utility>

#include "drillsp/errors.hpp"
#include "utils.hpp"

namespace drillsp {

namespace json = boost::json;

using utils::throwf;

namespace {

request_id id_from_json(const json::value& v) {
  if (v.is_null()) return nullptr;
  if (v.is_int64()) return v.get_int64();
  if (v.is_uint64() &&
      v.get_uint64() <=
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
    return static_cast<std::int64_t>(v.get_uint64());
  if (v.is_string()) return std::string{v.get_string()};
  throwf<decode_error>(
      "id must be an integer, a string or null, got {}", json::serialize(v));
}

response_error error_from_json(const json::value& v) {
  const auto* obj{v.if_object()};
  if (!obj) throwf<decode_error>("error member is not an object");

  const auto* code{obj->if_contains("code")};
  if (!code || !code->is_int64())
    throwf<decode_error>("error object has no integer code");

  response_error err{};
  err.code = code->get_int64();
  if (const auto* m{obj->if_contains("message")}; m && m->is_string())
    err.message = m->get_string();
  if (const auto* d{obj->if_contains("data")}) err.data = *d;
  return err;
}

}  // namespace

json::value id_to_json(const request_id& id) {
  return std::visit(
      [](auto&& v) -> json::value {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return nullptr;
        } else {
          return json::value(v);
        }
      },
      id);
}

std::string to_string(const request_id& id) {
  return std::visit(
      [](auto&& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
          return "null";
        } else if constexpr (std::is_same_v<T, std::string>) {
          return fmt::format("\"{}\"", v);
        } else {
          return std::to_string(v);
        }
      },
      id);
}

json::object encode_message(const message& msg) {
  json::object obj;
  obj["jsonrpc"] = "2.0";
  std::visit(
      [&](auto&& m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, call_message>) {
          obj["id"] = id_to_json(m.id);
          obj["method"] = m.method;
          if (!m.params.is_null()) obj["params"] = m.params;
        } else if constexpr (std::is_same_v<T, notification_message>) {
          obj["method"] = m.method;
          if (!m.params.is_null()) obj["params"] = m.params;
        } else {
          obj["id"] = id_to_json(m.id);
          if (m.error) {
            json::object error;
            error["code"] = m.error->code;
            error["message"] = m.error->message;
            if (!m.error->data.is_null()) error["data"] = m.error->data;
            obj["error"] = std::move(error);
          } else {
            obj["result"] = m.result;
          }
        }
      },
      msg);
  return obj;
}

message decode_message(std::string_view text) {
  boost::system::error_code ec;
  json::value parsed = json::parse(text, ec);
  if (ec)
    throwf<decode_error>(
        "Unparseable message body ({}): {}", ec.message(),
        utils::elide(text, 80));

  const auto* obj{parsed.if_object()};
  if (!obj) throwf<decode_error>("Message body is not a JSON object");

  const auto* id{obj->if_contains("id")};
  const auto* method{obj->if_contains("method")};
  const auto* params{obj->if_contains("params")};

  if (method && !method->is_string())
    throwf<decode_error>("method is not a string");

  if (id && method) {
    return call_message{
      .id = id_from_json(*id),
      .method = std::string{method->get_string()},
      .params = params ? *params : json::value{}};
  }
  if (method) {
    return notification_message{
      .method = std::string{method->get_string()},
      .params = params ? *params : json::value{}};
  }
  if (id) {
    response_message resp{.id = id_from_json(*id)};
    if (const auto* err{obj->if_contains("error")}; err && !err->is_null()) {
      resp.error = error_from_json(*err);
    } else if (const auto* res{obj->if_contains("result")}) {
      resp.result = *res;
    } else {
      throwf<decode_error>(
          "Response {} has neither result nor error", to_string(resp.id));
    }
    return resp;
  }
  throwf<decode_error>("Message has neither id nor method");
}

response_message make_result(request_id id, json::value result) {
  return {.id = std::move(id), .result = std::move(result)};
}

response_message make_error(
    request_id id, int code, std::string message, json::value data) {
  return {
    .id = std::move(id),
    .error = response_error{
      .code = code, .message = std::move(message), .data = std::move(data)}};
}

}  // namespace drillsp
