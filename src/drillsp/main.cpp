#include <fmt/format.h>
#include <fmt/std.h>

#include <iostream>
#include <span>

#include "../libdrillsp/logger.hpp"
#include "drillsp/drill.hpp"
#include "drillsp/errors.hpp"
#include "options.hpp"

int main(int argc, char* argv[]) {
  drillsp::drill_options opts{};
  int loglevel{3};

  auto done = drillsp::parse_options(std::span(argv, argc), loglevel, opts);
  if (done) return done.value();

  drillsp::logger::set_level(static_cast<drillsp::logger::level>(loglevel));
  LOG_DEBUG(
      "file={}\nserver={}\nlanguage={}\nroot={}\ntimeout={}ms", opts.file,
      opts.server.executable, opts.language_id,
      opts.root.value_or(drillsp::fs::path{}), opts.timeout.count());

  try {
    auto symbols = drillsp::fetch_document_symbols(opts);
    for (auto&& name : drillsp::function_names(symbols)) {
      std::cout << name << "\n";
    }
    return 0;
  } catch (const drillsp::remote_error& e) {
    LOG_FATAL("Server said no ({}): {}", e.code, e.what());
    return 1;
  } catch (std::exception& e) {
    LOG_FATAL("{}", e.what());
    return 1;
  }
}
