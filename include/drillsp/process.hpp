// SPDX-License-Identifier: MIT
#pragma once

#define BOOST_PROCESS_USE_STD_FS 1

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/readable_pipe.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/writable_pipe.hpp>
#include <boost/process/v2/process.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "drillsp/pipe_stream.hpp"

namespace drillsp {

namespace fs = std::filesystem;

/// What to run.  The defaults start gopls talking LSP on stdio.
struct server_command {
  std::string executable{"gopls"};
  std::vector<std::string> args{
    "-logfile=./gopls.log", "-rpc.trace", "-vv", "-mode=stdio"};
  bool trace_bytes{false};
};

/** @brief A language server subprocess.
 *
 * Its stdout and stdin are handed out once, as a @c pipe_stream, via
 * @c take_stream().  Its stderr is copied to ours for as long as it runs.
 * Exit is noticed asynchronously and only logged.  Create with
 * @c launch_server().
 */
class server_process : public std::enable_shared_from_this<server_process> {
 public:
  using duration = std::chrono::steady_clock::duration;

  server_process(
      const boost::asio::any_io_executor& ex, const fs::path& exe,
      const std::vector<std::string>& args, bool trace);

  server_process(const server_process&) = delete;
  server_process& operator=(const server_process&) = delete;
  ~server_process() = default;

  /// The child's stdout/stdin pair.  Throws @c std::logic_error if
  /// already taken.
  pipe_stream take_stream();

  /// Terminate the child unless it exits on its own within @p grace.
  void stop(duration grace);

  [[nodiscard]] bool running() const { return !exit_code_; }
  [[nodiscard]] std::optional<int> exit_code() const { return exit_code_; }
  [[nodiscard]] int pid() const;
  [[nodiscard]] const std::string& name() const { return name_; }

 private:
  friend std::shared_ptr<server_process> launch_server(
      const boost::asio::any_io_executor& ex, const server_command& cmd);

  void watch();

  std::string name_;
  boost::asio::readable_pipe from_child_;
  boost::asio::writable_pipe to_child_;
  boost::asio::readable_pipe err_;
  boost::process::v2::process proc_;
  boost::asio::steady_timer grace_timer_;
  std::optional<pipe_stream> stream_;
  std::optional<int> exit_code_;
};

/** @brief Start @p cmd with our environment.
 *
 * The executable is looked up on PATH unless it contains a slash.
 * Throws @c launch_error if it can't be found or started.  Makes this
 * process ignore SIGPIPE, so writing to a dead server is an error code
 * rather than a signal.
 */
std::shared_ptr<server_process> launch_server(
    const boost::asio::any_io_executor& ex, const server_command& cmd);

}  // namespace drillsp
