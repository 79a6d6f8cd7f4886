#include "mpb/net/transfer.hpp"

#include <array>
#include <cstddef>
#include <vector>

#include <boost/asio/buffer.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>

#include "mpb/checksum/checksum.hpp"
#include "mpb/core/error.hpp"
#include "mpb/runtime/runtime.hpp"

namespace mpb {

namespace asio = boost::asio;
using asio::posix::stream_descriptor;

namespace {

// Progress of the upload direction, shared by the two tasks of one transfer.
// Both run on the same strand.
struct Upload {
  uint64_t sent{0};
  bool closed{false};
  bool failed{false};
};

asio::awaitable<void> send_and_close(stream_descriptor& file, WriteHalf out, Upload& upload) {
  try {
    upload.sent = co_await send_file(file, out);
    out.shutdown();
    upload.closed = true;
  } catch (...) {
    upload.failed = true;
    out.abort();
    throw;
  }
}

// Reads the reply of a remote-checksum peer: nothing until the upload is
// half-closed, then exactly one byte followed by end of stream. Any deviation
// tears the connection down so the upload stops as well.
asio::awaitable<void> receive_remote_checksum(ReadHalf in,
                                              WriteHalf out,
                                              const Upload& upload,
                                              uint8_t& checksum) {
  std::array<std::byte, 64> buffer{};
  size_t received = 0;

  for (;;) {
    boost::system::error_code ec;
    const size_t n = co_await in.async_read_some(asio::buffer(buffer),
                                                 asio::redirect_error(asio::use_awaitable, ec));
    if (upload.failed) {
      co_return;
    }
    if (n > 0 && !upload.closed) {
      out.abort();
      throw Error{ErrorCode::ProtocolError,
                  fmt::format("peer replied after {} of the uploaded bytes, before end of stream",
                              upload.sent)};
    }
    if (n > 0 && received == 0) {
      checksum = static_cast<uint8_t>(buffer[0]);
    }
    received += n;
    if (received > 1) {
      out.abort();
      throw Error{ErrorCode::ProtocolError, "unexpected data after the checksum byte"};
    }
    if (ec == asio::error::eof || (ec == asio::error::connection_reset && received == 0)) {
      break;
    }
    if (ec) {
      out.abort();
      detail::throw_io_error(ec, "checksum read failed");
    }
  }

  if (received == 0) {
    out.abort();
    throw Error{ErrorCode::ProtocolError, "connection closed before the checksum byte"};
  }
}

asio::awaitable<void> receive_echo(ReadHalf in, ChecksumSink& sink) {
  co_await consume_stream(in, sink);
}

}  // namespace

asio::awaitable<uint8_t> transfer(std::filesystem::path input,
                                  tcp::endpoint address,
                                  Protocol protocol) {
  auto file = co_await open_input(input);
  SplitConnection conn(co_await connect(address));
  Upload upload;

  if (protocol == Protocol::RemoteChecksum) {
    uint8_t checksum = 0;
    std::vector<asio::awaitable<void>> tasks;
    tasks.push_back(receive_remote_checksum(conn.reader(), conn.writer(), upload, checksum));
    tasks.push_back(send_and_close(file, conn.writer(), upload));
    rethrow_first(co_await join_all(std::move(tasks)));
    co_return checksum;
  }

  ChecksumSink sink;
  std::vector<asio::awaitable<void>> tasks;
  tasks.push_back(send_and_close(file, conn.writer(), upload));
  tasks.push_back(receive_echo(conn.reader(), sink));
  rethrow_first(co_await join_all(std::move(tasks)));
  if (sink.bytes() != upload.sent) {
    throw Error{ErrorCode::ProtocolError,
                fmt::format("echo returned {} of {} bytes", sink.bytes(), upload.sent)};
  }
  co_return sink.digest();
}

}  // namespace mpb
