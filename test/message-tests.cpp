#include <doctest/doctest.h>

#include <boost/json.hpp>
#include <string>
#include <variant>

#include "drillsp/errors.hpp"
#include "drillsp/message.hpp"

namespace json = boost::json;
namespace dl = drillsp;

TEST_CASE("decode classifies by field presence") {
  auto call{dl::decode_message(
      R"({"jsonrpc":"2.0","id":3,"method":"initialize","params":{"a":1}})")};
  REQUIRE(std::holds_alternative<dl::call_message>(call));
  const auto& c{std::get<dl::call_message>(call)};
  CHECK(c.id == dl::request_id{std::int64_t{3}});
  CHECK(c.method == "initialize");
  CHECK(c.params.as_object().at("a").as_int64() == 1);

  auto note{dl::decode_message(
      R"({"jsonrpc":"2.0","method":"window/logMessage"})")};
  REQUIRE(std::holds_alternative<dl::notification_message>(note));
  CHECK(std::get<dl::notification_message>(note).params.is_null());

  auto resp{dl::decode_message(R"({"jsonrpc":"2.0","id":"x","result":null})")};
  REQUIRE(std::holds_alternative<dl::response_message>(resp));
  const auto& r{std::get<dl::response_message>(resp)};
  CHECK(r.id == dl::request_id{std::string{"x"}});
  CHECK(r.result.is_null());
  CHECK_FALSE(r.error);
}

TEST_CASE("decode error responses") {
  auto resp{dl::decode_message(
      R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error","data":"eh"}})")};
  REQUIRE(std::holds_alternative<dl::response_message>(resp));
  const auto& r{std::get<dl::response_message>(resp)};
  CHECK(std::holds_alternative<std::nullptr_t>(r.id));
  REQUIRE(r.error);
  CHECK(r.error->code == dl::rpc_errc::parse_error);
  CHECK(r.error->message == "Parse error");
  CHECK(r.error->data.as_string() == "eh");
}

TEST_CASE("decode rejects malformed bodies") {
  CHECK_THROWS_AS(dl::decode_message("{not json"), dl::decode_error);
  CHECK_THROWS_AS(dl::decode_message("[1,2]"), dl::decode_error);
  CHECK_THROWS_AS(dl::decode_message(R"({"jsonrpc":"2.0"})"), dl::decode_error);
  CHECK_THROWS_AS(
      dl::decode_message(R"({"id":1,"method":42})"), dl::decode_error);
  CHECK_THROWS_AS(
      dl::decode_message(R"({"id":1.5,"result":0})"), dl::decode_error);
  CHECK_THROWS_AS(dl::decode_message(R"({"id":1})"), dl::decode_error);
  CHECK_THROWS_AS(
      dl::decode_message(R"({"id":1,"error":"bad"})"), dl::decode_error);
}

TEST_CASE("encode adds version and omits null params") {
  auto call{dl::encode_message(dl::call_message{.id = 7, .method = "shutdown"})};
  CHECK(call.at("jsonrpc").as_string() == "2.0");
  CHECK(call.at("id").as_int64() == 7);
  CHECK(call.at("method").as_string() == "shutdown");
  CHECK_FALSE(call.contains("params"));

  auto note{dl::encode_message(dl::notification_message{
    .method = "initialized", .params = json::object{}})};
  CHECK_FALSE(note.contains("id"));
  CHECK(note.at("params").as_object().empty());
}

TEST_CASE("encode responses") {
  auto ok{dl::encode_message(dl::make_result(std::string{"s1"}, nullptr))};
  CHECK(ok.at("id").as_string() == "s1");
  CHECK(ok.contains("result"));
  CHECK(ok.at("result").is_null());
  CHECK_FALSE(ok.contains("error"));

  auto err{dl::encode_message(dl::make_error(
      4, dl::rpc_errc::method_not_found, "Method not found",
      json::value("foo/bar")))};
  CHECK_FALSE(err.contains("result"));
  const auto& e{err.at("error").as_object()};
  CHECK(e.at("code").as_int64() == -32601);
  CHECK(e.at("message").as_string() == "Method not found");
  CHECK(e.at("data").as_string() == "foo/bar");
}

TEST_CASE("request ids print like JSON") {
  CHECK(dl::to_string(dl::request_id{std::int64_t{12}}) == "12");
  CHECK(dl::to_string(dl::request_id{std::string{"a"}}) == "\"a\"");
  CHECK(dl::to_string(dl::request_id{nullptr}) == "null");
}
