#include "mpb/net/server.hpp"

#include <array>
#include <cstddef>
#include <exception>
#include <string>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include "mpb/checksum/checksum.hpp"
#include "mpb/core/error.hpp"
#include "mpb/core/log.hpp"

namespace mpb {

namespace asio = boost::asio;

namespace {

constexpr size_t kEchoChunkSize = 8 * 1024;

std::string peer_of(const tcp::socket& socket) {
  boost::system::error_code ec;
  const auto ep = socket.remote_endpoint(ec);
  return ec ? std::string{"<unknown peer>"} : to_string(ep);
}

}  // namespace

asio::awaitable<uint64_t> EchoHandler::run() {
  ReadHalf in = conn_.reader();
  WriteHalf out = conn_.writer();
  std::array<std::byte, kEchoChunkSize> buffer{};
  uint64_t mirrored = 0;

  for (;;) {
    boost::system::error_code ec;
    const size_t n = co_await in.async_read_some(asio::buffer(buffer),
                                                 asio::redirect_error(asio::use_awaitable, ec));
    if (n > 0) {
      boost::system::error_code wec;
      co_await asio::async_write(out, asio::buffer(buffer.data(), n),
                                 asio::redirect_error(asio::use_awaitable, wec));
      if (wec) {
        detail::throw_io_error(wec, "echo write failed");
      }
      mirrored += n;
    }
    if (ec == asio::error::eof) {
      break;
    }
    if (ec) {
      detail::throw_io_error(ec, "echo read failed");
    }
  }

  out.shutdown();
  co_return mirrored;
}

const char* to_string(HandlerState state) noexcept {
  switch (state) {
    case HandlerState::Reading:
      return "reading";
    case HandlerState::Computed:
      return "computed";
    case HandlerState::Responding:
      return "responding";
    case HandlerState::Closed:
      return "closed";
  }
  return "unknown";
}

asio::awaitable<uint8_t> ChecksumHandler::run() {
  state_ = HandlerState::Reading;
  ChecksumSink sink;
  ReadHalf in = conn_.reader();
  co_await consume_stream(in, sink);
  bytes_ = sink.bytes();

  state_ = HandlerState::Computed;
  const std::array<std::byte, 1> reply{static_cast<std::byte>(sink.digest())};

  state_ = HandlerState::Responding;
  WriteHalf out = conn_.writer();
  boost::system::error_code ec;
  co_await asio::async_write(out, asio::buffer(reply),
                             asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    detail::throw_io_error(ec, "checksum reply failed");
  }
  out.shutdown();

  state_ = HandlerState::Closed;
  co_return sink.digest();
}

asio::awaitable<Expected<SessionReport>> handle_connection(tcp::socket socket, Protocol protocol) {
  Error failure;
  SessionReport report{};

  if (protocol == Protocol::Echo) {
    EchoHandler handler(std::move(socket));
    try {
      report.bytes = co_await handler.run();
      co_return report;
    } catch (const std::exception& e) {
      failure = classify(e);
    }
    co_return std::unexpected(std::move(failure));
  }

  ChecksumHandler handler(std::move(socket));
  try {
    report.checksum = co_await handler.run();
    report.bytes = handler.bytes();
    co_return report;
  } catch (const std::exception& e) {
    failure = classify(e);
  }
  co_return std::unexpected(Error{
      failure.code(), fmt::format("{} (while {})", failure.what(), to_string(handler.state())),
      failure.detail()});
}

struct Server::State {
  State(const asio::any_io_executor& pool, const asio::any_io_executor& strand)
      : pool_executor(pool), acceptor(strand) {}

  asio::any_io_executor pool_executor;
  tcp::acceptor acceptor;
  Protocol protocol{Protocol::RemoteChecksum};
  uint32_t max_connections{0};

  std::atomic<uint64_t> active{0};
  std::atomic<uint64_t> completed{0};
  std::atomic<uint64_t> failed{0};
};

asio::awaitable<void> Server::run_session(std::shared_ptr<State> state,
                                          tcp::socket socket,
                                          std::string peer) {
  auto result = co_await handle_connection(std::move(socket), state->protocol);
  if (result) {
    if (result->checksum) {
      log_info("Finished connection from {} ({} bytes, checksum 0x{:02x})", peer, result->bytes,
               *result->checksum);
    } else {
      log_info("Finished connection from {} ({} bytes)", peer, result->bytes);
    }
    state->completed.fetch_add(1, std::memory_order_relaxed);
  } else {
    log_error("Connection from {} failed: {}", peer, describe(result.error()));
    state->failed.fetch_add(1, std::memory_order_relaxed);
  }
  state->active.fetch_sub(1, std::memory_order_relaxed);
}

asio::awaitable<void> Server::accept_loop(std::shared_ptr<State> state) {
  for (;;) {
    boost::system::error_code ec;
    tcp::socket socket = co_await state->acceptor.async_accept(
        asio::any_io_executor(asio::make_strand(state->pool_executor)),
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::operation_aborted || !state->acceptor.is_open()) {
      co_return;
    }
    if (ec) {
      log_warn("accept failed: {}", ec.message());
      continue;
    }

    const std::string peer = peer_of(socket);
    if (state->max_connections != 0 &&
        state->active.load(std::memory_order_relaxed) >= state->max_connections) {
      log_warn("Refused connection from {}: {} connections active", peer, state->max_connections);
      socket.close(ec);
      continue;
    }

    log_info("Got connection from {}", peer);
    state->active.fetch_add(1, std::memory_order_relaxed);
    auto ex = socket.get_executor();
    asio::co_spawn(ex, run_session(state, std::move(socket), peer), asio::detached);
  }
}

Server::Server(Runtime& runtime, const ServerConfig& cfg)
    : state_(std::make_shared<State>(runtime.get_executor(), runtime.make_strand())) {
  state_->protocol = cfg.protocol;
  state_->max_connections = cfg.max_connections;

  boost::system::error_code ec;
  const auto address = asio::ip::make_address(cfg.address, ec);
  if (ec) {
    throw Error{ErrorCode::InvalidArgument,
                fmt::format("invalid listen address {}: {}", cfg.address, ec.message())};
  }
  const tcp::endpoint endpoint{address, cfg.port};

  auto& acceptor = state_->acceptor;
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    throw Error{ErrorCode::IoError,
                fmt::format("failed to listen on {}: {}", to_string(endpoint), ec.message())};
  }
  port_ = acceptor.local_endpoint(ec).port();
}

Server::~Server() { stop(); }

void Server::start() {
  asio::co_spawn(state_->acceptor.get_executor(), accept_loop(state_), asio::detached);
}

void Server::stop() {
  asio::post(state_->acceptor.get_executor(), [state = state_]() {
    boost::system::error_code ec;
    state->acceptor.close(ec);
  });
}

uint64_t Server::active_connections() const noexcept {
  return state_->active.load(std::memory_order_relaxed);
}

uint64_t Server::completed_connections() const noexcept {
  return state_->completed.load(std::memory_order_relaxed);
}

uint64_t Server::failed_connections() const noexcept {
  return state_->failed.load(std::memory_order_relaxed);
}

}  // namespace mpb
