#include "options.hpp"

#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace drillsp {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, drill_options& opts) {
  CLI::App app{"List the functions a language server sees in a file"};

  std::optional<fs::path> root;
  std::vector<std::string> server_args;
  long timeout_ms{opts.timeout.count()};

  app.add_option(
      "-d,--debug",
      loglevel,
      "Debug log level (0=FATAL .. 3=INFO .. 5=TRACE)")
    ->capture_default_str();
  auto* server_opt = app.add_option(
      "--server",
      opts.server.executable,
      "Language server executable")
    ->capture_default_str();
  auto* args_opt = app.add_option(
      "--server-arg",
      server_args,
      "Argument for the language server (repeatable)")
    ->allow_extra_args(false);
  app.add_option(
      "--language",
      opts.language_id,
      "Language id sent with didOpen")
    ->capture_default_str();
  app.add_option(
      "--root",
      root,
      "Workspace root (default: the file's directory)");
  app.add_option(
      "--timeout",
      timeout_ms,
      "Per-request timeout in milliseconds")
    ->capture_default_str()
    ->check(CLI::PositiveNumber);
  app.add_flag(
      "--trace", opts.server.trace_bytes,
      "Log every byte exchanged with the server");
  app.add_option(
      "file",
      opts.file,
      "File to list functions of")
    ->required();

  try {
    app.parse(static_cast<int>(args.size()), args.data());
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  // A different server doesn't want gopls flags
  if (args_opt->count() > 0)
    opts.server.args = server_args;
  else if (server_opt->count() > 0)
    opts.server.args.clear();

  opts.root = root;
  opts.timeout = std::chrono::milliseconds{timeout_ms};
  return std::nullopt;
}

}  // namespace drillsp
