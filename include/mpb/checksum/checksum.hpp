#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>

#include "mpb/core/types.hpp"

namespace mpb {

// XOR-fold of every byte in data, starting from seed.
uint8_t xor_fold(std::span<const std::byte> data, uint8_t seed = 0) noexcept;

class ChecksumSink {
 public:
  ChecksumSink() = default;

  void consume(std::span<const std::byte> data) noexcept;
  uint8_t digest() const noexcept { return acc_; }
  uint64_t bytes() const noexcept { return bytes_; }

 private:
  uint8_t acc_{0};
  uint64_t bytes_{0};
};

namespace detail {

[[noreturn]] void throw_io_error(const boost::system::error_code& ec, const char* what);

}  // namespace detail

// Feeds everything readable from stream into sink until end of stream. A
// failed read throws Error{IoError}; the sink then holds a prefix only and
// must be discarded.
template <typename AsyncReadStream>
boost::asio::awaitable<void> consume_stream(AsyncReadStream& stream,
                                            ChecksumSink& sink,
                                            size_t chunk_size = kDefaultChunkSize) {
  std::vector<std::byte> buffer(chunk_size == 0 ? kDefaultChunkSize : chunk_size);
  for (;;) {
    boost::system::error_code ec;
    const size_t n = co_await stream.async_read_some(
        boost::asio::buffer(buffer), boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    sink.consume(std::span<const std::byte>(buffer.data(), n));
    if (ec == boost::asio::error::eof) {
      break;
    }
    if (ec) {
      detail::throw_io_error(ec, "read failed");
    }
  }
}

template <typename AsyncReadStream>
boost::asio::awaitable<uint8_t> hash(AsyncReadStream& stream,
                                     size_t chunk_size = kDefaultChunkSize) {
  ChecksumSink sink;
  co_await consume_stream(stream, sink, chunk_size);
  co_return sink.digest();
}

// Opens path for streaming reads on the calling coroutine's executor. Throws
// Error{IoError} naming the path.
boost::asio::awaitable<boost::asio::posix::stream_descriptor> open_input(
    std::filesystem::path path);

// Local disk read path: opens path and hashes its contents.
boost::asio::awaitable<uint8_t> hash_file(std::filesystem::path path,
                                          size_t chunk_size = kDefaultChunkSize);

}  // namespace mpb
