#include <doctest/doctest.h>

#define BOOST_PROCESS_USE_STD_FS 1

#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/process/v2/process.hpp>
#include <boost/process/v2/stdio.hpp>
#include <filesystem>
#include <string>
#include <vector>

#include "drillsp/drill.hpp"
#include "drillsp/errors.hpp"
#include "test_config.h"

namespace asio = boost::asio;
namespace fs = std::filesystem;
namespace p2 = boost::process::v2;
namespace dl = drillsp;

using namespace std::chrono_literals;

namespace {

dl::drill_options mock_options(std::vector<std::string> script = {}) {
  dl::drill_options opts;
  opts.file = "/tmp/a.go";
  opts.text = "func F(){}\nfunc g(){}\n";
  opts.server = {.executable = DRILLSP_MOCK_SERVER, .args = std::move(script)};
  opts.timeout = 10s;
  return opts;
}

struct cli_result {
  int exit_code;
  std::string output;
};

cli_result run_cli(const std::vector<std::string>& args) {
  asio::io_context ctx;
  asio::readable_pipe rp_out{ctx};
  std::string output;

  p2::process proc{
    ctx, fs::path{DRILLSP_BINARY}, args,
    p2::process_stdio{.in = nullptr, .out = rp_out, .err = nullptr}};

  boost::system::error_code ec;
  asio::read(rp_out, asio::dynamic_buffer(output), ec);
  CHECK((!ec || ec == asio::error::eof));
  return {proc.wait(), output};
}

}  // namespace

TEST_CASE("functions of an opened document") {
  auto symbols{dl::fetch_document_symbols(mock_options())};
  CHECK(
      dl::function_names(symbols) == std::vector<std::string>{"F", "g"});
}

TEST_CASE("non-function symbols are kept by the fetch") {
  auto opts{mock_options()};
  opts.text = "type T struct{}\nfunc (t T) M() {}\nfunc F() {}\n";
  auto symbols{dl::fetch_document_symbols(opts)};

  REQUIRE(symbols.size() == 3);
  CHECK(symbols[0].kind == dl::symbol_kind::struct_);
  CHECK(symbols[1].kind == dl::symbol_kind::method);
  CHECK(dl::function_names(symbols) == std::vector<std::string>{"F"});
}

TEST_CASE("server chatter doesn't get in the way") {
  auto symbols{dl::fetch_document_symbols(mock_options(
      {"--show-message-type", "9", "--ask-configuration"}))};
  CHECK(
      dl::function_names(symbols) == std::vector<std::string>{"F", "g"});

  symbols = dl::fetch_document_symbols(
      mock_options({"--show-message-type", "2"}));
  CHECK(symbols.size() == 2);
}

TEST_CASE("a refused initialize aborts the drill") {
  CHECK_THROWS_AS(
      dl::fetch_document_symbols(mock_options({"--fail-initialize"})),
      dl::remote_error);
}

TEST_CASE("a server dying mid-request closes the connection") {
  std::string error;
  try {
    dl::fetch_document_symbols(
        mock_options({"--exit-on", "textDocument/documentSymbol"}));
  } catch (const dl::connection_closed_error& e) {
    error = e.what();
  }
  // The handshake went through, the symbol request is what got cut off
  CHECK(error.find("textDocument/documentSymbol") != std::string::npos);
}

TEST_CASE("a missing server is a launch error") {
  auto opts{mock_options()};
  opts.server.executable = "drillsp-no-such-server";
  CHECK_THROWS_AS(dl::fetch_document_symbols(opts), dl::launch_error);
}

TEST_CASE("documents are read from disk when no text is given") {
  dl::drill_options opts;
  opts.file = fs::path{TEST_FIXTURE_DIR} / "sample.go";
  opts.server = {.executable = DRILLSP_MOCK_SERVER, .args = {}};

  auto names{dl::function_names(dl::fetch_document_symbols(opts))};
  CHECK(names == std::vector<std::string>{"Origin", "distance", "abs"});

  opts.file = fs::path{TEST_FIXTURE_DIR} / "no-such-file.go";
  CHECK_THROWS_AS(dl::fetch_document_symbols(opts), std::runtime_error);
}

TEST_CASE("cli prints one function per line") {
  auto fixture{(fs::path{TEST_FIXTURE_DIR} / "sample.go").string()};
  auto res{run_cli({"--server", DRILLSP_MOCK_SERVER, fixture})};
  CHECK(res.exit_code == 0);
  CHECK(res.output == "Origin\ndistance\nabs\n");
}

TEST_CASE("cli options reach the drill") {
  auto fixture{(fs::path{TEST_FIXTURE_DIR} / "sample.go").string()};
  auto res{run_cli(
      {"-d", "1", "--timeout", "5000", "--language", "go", "--root",
       TEST_FIXTURE_DIR, "--server", DRILLSP_MOCK_SERVER,
       "--server-arg=--ask-configuration", fixture})};
  CHECK(res.exit_code == 0);
  CHECK(res.output == "Origin\ndistance\nabs\n");

  auto bad_timeout{run_cli(
      {"--timeout", "-3", "--server", DRILLSP_MOCK_SERVER, fixture})};
  CHECK(bad_timeout.exit_code != 0);
  CHECK(bad_timeout.output.empty());
}

TEST_CASE("cli fails loudly") {
  auto fixture{(fs::path{TEST_FIXTURE_DIR} / "sample.go").string()};

  auto missing{run_cli({"--server", "drillsp-no-such-server", fixture})};
  CHECK(missing.exit_code != 0);
  CHECK(missing.output.empty());

  auto refused{run_cli(
      {"--server", DRILLSP_MOCK_SERVER, "--server-arg=--fail-initialize",
       fixture})};
  CHECK(refused.exit_code != 0);
  CHECK(refused.output.empty());

  auto unreadable{run_cli(
      {"--server", DRILLSP_MOCK_SERVER, fixture + ".nope"})};
  CHECK(unreadable.exit_code != 0);

  auto no_file{run_cli({"--server", DRILLSP_MOCK_SERVER})};
  CHECK(no_file.exit_code != 0);
}
