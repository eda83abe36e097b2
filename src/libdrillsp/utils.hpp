#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace drillsp::utils {
template <typename Exception = std::runtime_error, typename... Args>
[[noreturn]] void throwf(
    fmt::format_string<Args...> format_str, Args&&... args) {
  throw Exception(fmt::format(format_str, std::forward<Args>(args)...));
}

// Shorten a payload for a log line, keeping the head.
inline std::string elide(std::string_view text, std::size_t max = 256) {
  if (text.size() <= max) return std::string{text};
  return fmt::format("{}... ({} bytes)", text.substr(0, max), text.size());
}

}  // namespace drillsp::utils
