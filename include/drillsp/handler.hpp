// SPDX-License-Identifier: MIT
#pragma once

#include <boost/json.hpp>
#include <optional>
#include <string_view>
#include <vector>

#include "drillsp/lsp.hpp"
#include "drillsp/message.hpp"

namespace drillsp {

/// Receives everything the peer initiates: calls and notifications.
///
/// The dispatch loop calls @c handle() once per inbound call or
/// notification, in arrival order.  @p id is empty for notifications.
/// For a call, the returned value is sent back as the result; returning
/// @c std::nullopt declines the call and the peer gets "method not
/// found".  The return value of a notification is ignored.
///
/// Implementations own their error handling.  A malformed payload must
/// be logged and skipped, never allowed to escape into the dispatch loop.
class notification_handler {
 public:
  notification_handler() = default;
  notification_handler(const notification_handler&) = delete;
  notification_handler(notification_handler&&) = delete;
  notification_handler& operator=(const notification_handler&) = delete;
  notification_handler& operator=(notification_handler&&) = delete;
  virtual ~notification_handler() = default;

  virtual std::optional<boost::json::value> handle(
      std::string_view method, const std::optional<request_id>& id,
      const boost::json::value& params) = 0;
};

/// Logs what a language server says on its own and answers the few
/// requests servers commonly send to their clients.
class lsp_message_handler : public notification_handler {
 public:
  std::optional<boost::json::value> handle(
      std::string_view method, const std::optional<request_id>& id,
      const boost::json::value& params) override;

  /// Every show/log message accepted so far, oldest first.
  [[nodiscard]] const std::vector<show_message_params>& shown() const {
    return shown_;
  }

 private:
  void on_message(std::string_view method, const std::optional<request_id>& id,
                  const boost::json::value& params);
  static void on_diagnostics(const boost::json::value& params);

  std::vector<show_message_params> shown_;
};

}  // namespace drillsp
