// SPDX-License-Identifier: MIT
#include "drillsp/process.hpp"

#include <fmt/format.h>
#include <fmt/std.h>

#include <array>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/process/v2/environment.hpp>
#include <boost/process/v2/stdio.hpp>
#include <boost/system/system_error.hpp>
#include <csignal>
#include <stdexcept>
#include <string_view>

#include "drillsp/errors.hpp"
#include "logger.hpp"
#include "utils.hpp"

namespace drillsp {

namespace asio = boost::asio;
namespace p2 = boost::process::v2;
namespace sys = boost::system;

using utils::throwf;

namespace {

auto args_to_string(std::string res, const std::vector<std::string>& args) {
  for (const auto& a : args) {
    res += " ";
    res += a;
  }
  return res;
}

fs::path resolve_executable(const std::string& exe) {
  if (exe.empty()) throwf<launch_error>("No server executable given");
  if (exe.find('/') != std::string::npos) {
    if (!fs::exists(exe)) throwf<launch_error>("{} doesn't exist", exe);
    return exe;
  }
  auto found{p2::environment::find_executable(exe)};
  if (found.empty()) throwf<launch_error>("Can't find '{}' on PATH", exe);
  return found;
}

asio::awaitable<void> forward_stderr(std::shared_ptr<server_process> self,
                                     asio::readable_pipe& err) {
  std::array<char, 4096> buf{};
  for (;;) {
    sys::error_code ec;
    auto n{co_await err.async_read_some(
        asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec))};
    if (n) fmt::print(stderr, "{}", std::string_view{buf.data(), n});
    if (ec) {
      if (ec != asio::error::eof)
        LOG_DEBUG("{} stderr: {}", self->name(), ec.message());
      break;
    }
  }
}

}  // namespace

server_process::server_process(
    const asio::any_io_executor& ex, const fs::path& exe,
    const std::vector<std::string>& args, bool trace)
    : name_{exe.filename().string()},
      from_child_{ex},
      to_child_{ex},
      err_{ex},
      proc_{
        ex, exe, args,
        p2::process_stdio{.in = to_child_, .out = from_child_, .err = err_}},
      grace_timer_{ex} {
  stream_.emplace(std::move(from_child_), std::move(to_child_), trace);
}

int server_process::pid() const { return static_cast<int>(proc_.id()); }

pipe_stream server_process::take_stream() {
  if (!stream_) throw std::logic_error{"server stream already taken"};
  pipe_stream s{std::move(*stream_)};
  stream_.reset();
  return s;
}

void server_process::watch() {
  asio::co_spawn(
      err_.get_executor(), forward_stderr(shared_from_this(), err_),
      asio::detached);

  proc_.async_wait([self = shared_from_this()](sys::error_code ec, int code) {
    if (ec) {
      if (self->running())
        LOG_WARN("Lost track of {}: {}", self->name_, ec.message());
      return;
    }
    self->exit_code_ = code;
    if (code == 0)
      LOG_INFO("{} exited cleanly", self->name_);
    else
      LOG_WARN("{} exited with status {}", self->name_, code);
    self->grace_timer_.cancel();
  });
}

void server_process::stop(duration grace) {
  if (!running()) return;
  grace_timer_.expires_after(grace);
  grace_timer_.async_wait([self = shared_from_this()](sys::error_code ec) {
    if (ec || !self->running()) return;
    LOG_WARN("{} still running, terminating it", self->name_);
    sys::error_code tec;
    self->proc_.terminate(tec);
    if (tec) {
      LOG_ERROR("Can't terminate {}: {}", self->name_, tec.message());
      return;
    }
    // terminate() reaps the child, the exit monitor may not see it
    if (self->running()) self->exit_code_ = self->proc_.exit_code();
  });
}

std::shared_ptr<server_process> launch_server(
    const asio::any_io_executor& ex, const server_command& cmd) {
  auto exe{resolve_executable(cmd.executable)};
  std::signal(SIGPIPE, SIG_IGN);

  LOG_INFO("Starting {}", args_to_string(exe.string(), cmd.args));
  std::shared_ptr<server_process> server;
  try {
    server =
        std::make_shared<server_process>(ex, exe, cmd.args, cmd.trace_bytes);
  } catch (const sys::system_error& e) {
    throwf<launch_error>("Can't start {}: {}", exe, e.code().message());
  }
  LOG_DEBUG("{} has pid {}", server->name(), server->pid());
  server->watch();
  return server;
}

}  // namespace drillsp
