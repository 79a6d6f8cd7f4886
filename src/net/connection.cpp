#include "mpb/net/connection.hpp"

#include <array>
#include <cstddef>

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>

#include "mpb/checksum/checksum.hpp"
#include "mpb/core/error.hpp"

namespace mpb {

namespace asio = boost::asio;

namespace {

constexpr size_t kSendChunkSize = 64 * 1024;

}  // namespace

void WriteHalf::shutdown() {
  boost::system::error_code ec;
  socket_->shutdown(tcp::socket::shutdown_send, ec);
  if (ec) {
    detail::throw_io_error(ec, "half-close failed");
  }
}

void WriteHalf::abort() noexcept {
  boost::system::error_code ec;
  socket_->shutdown(tcp::socket::shutdown_both, ec);
  socket_->cancel(ec);
}

std::string to_string(const tcp::endpoint& ep) {
  if (ep.address().is_v6()) {
    return fmt::format("[{}]:{}", ep.address().to_string(), ep.port());
  }
  return fmt::format("{}:{}", ep.address().to_string(), ep.port());
}

asio::awaitable<tcp::socket> connect(tcp::endpoint address) {
  tcp::socket socket(co_await asio::this_coro::executor);
  boost::system::error_code ec;
  co_await socket.async_connect(address, asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    throw Error{ErrorCode::ConnectError,
                fmt::format("connect to {} failed: {}", to_string(address), ec.message())};
  }
  co_return socket;
}

asio::awaitable<uint64_t> send_file(asio::posix::stream_descriptor& src, WriteHalf out) {
  std::array<std::byte, kSendChunkSize> buffer{};
  uint64_t sent = 0;
  for (;;) {
    boost::system::error_code ec;
    const size_t n = co_await src.async_read_some(asio::buffer(buffer),
                                                  asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::eof) {
      break;
    }
    if (ec) {
      detail::throw_io_error(ec, "file read failed");
    }
    co_await asio::async_write(out, asio::buffer(buffer.data(), n),
                               asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
      detail::throw_io_error(ec, "send failed");
    }
    sent += n;
  }
  co_return sent;
}

}  // namespace mpb
