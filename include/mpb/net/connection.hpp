#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>

namespace mpb {

using tcp = boost::asio::ip::tcp;

// Inbound direction of a connection. Satisfies AsyncReadStream.
class ReadHalf {
 public:
  using executor_type = tcp::socket::executor_type;

  explicit ReadHalf(tcp::socket& socket) : socket_(&socket) {}

  executor_type get_executor() noexcept { return socket_->get_executor(); }

  template <typename MutableBufferSequence, typename ReadToken>
  auto async_read_some(const MutableBufferSequence& buffers, ReadToken&& token) {
    return socket_->async_read_some(buffers, std::forward<ReadToken>(token));
  }

 private:
  tcp::socket* socket_;
};

// Outbound direction of a connection. Satisfies AsyncWriteStream.
class WriteHalf {
 public:
  using executor_type = tcp::socket::executor_type;

  explicit WriteHalf(tcp::socket& socket) : socket_(&socket) {}

  executor_type get_executor() noexcept { return socket_->get_executor(); }

  template <typename ConstBufferSequence, typename WriteToken>
  auto async_write_some(const ConstBufferSequence& buffers, WriteToken&& token) {
    return socket_->async_write_some(buffers, std::forward<WriteToken>(token));
  }

  // Half-close: the peer observes end of stream, the read half stays open.
  void shutdown();

  // Tears down both directions so pending operations on either half finish.
  void abort() noexcept;

 private:
  tcp::socket* socket_;
};

// Owns a connected socket and hands out its two directions. One task may
// drive the read half while another drives the write half.
class SplitConnection {
 public:
  explicit SplitConnection(tcp::socket socket) : socket_(std::move(socket)) {}

  SplitConnection(const SplitConnection&) = delete;
  SplitConnection& operator=(const SplitConnection&) = delete;

  ReadHalf reader() noexcept { return ReadHalf{socket_}; }
  WriteHalf writer() noexcept { return WriteHalf{socket_}; }

 private:
  tcp::socket socket_;
};

std::string to_string(const tcp::endpoint& ep);

// Throws Error{ConnectError} when the peer is unreachable.
boost::asio::awaitable<tcp::socket> connect(tcp::endpoint address);

// Streams src into out until src reports end of stream. Returns the number of
// bytes sent. Throws Error{IoError}.
boost::asio::awaitable<uint64_t> send_file(boost::asio::posix::stream_descriptor& src,
                                           WriteHalf out);

}  // namespace mpb
