#pragma once

#include <optional>
#include <span>

#include "drillsp/drill.hpp"

namespace drillsp {

std::optional<int> parse_options(
    std::span<char*> args, int& loglevel, drill_options& opts);

}  // namespace drillsp
