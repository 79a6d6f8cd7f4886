#include "mpb/checksum/checksum.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

#include <boost/asio/this_coro.hpp>

#include "mpb/core/error.hpp"

namespace mpb {

uint8_t xor_fold(std::span<const std::byte> data, uint8_t seed) noexcept {
  uint8_t acc = seed;
  for (const std::byte b : data) {
    acc ^= static_cast<uint8_t>(b);
  }
  return acc;
}

void ChecksumSink::consume(std::span<const std::byte> data) noexcept {
  acc_ = xor_fold(data, acc_);
  bytes_ += data.size();
}

namespace detail {

void throw_io_error(const boost::system::error_code& ec, const char* what) {
  throw Error{ErrorCode::IoError, std::string(what) + ": " + ec.message()};
}

}  // namespace detail

boost::asio::awaitable<boost::asio::posix::stream_descriptor> open_input(
    std::filesystem::path path) {
  const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    throw Error{ErrorCode::IoError,
                "open for read failed: " + path.string() + ": " + std::strerror(errno)};
  }
  // Regular files are not pollable; asio performs their reads immediately.
  co_return boost::asio::posix::stream_descriptor(co_await boost::asio::this_coro::executor, fd);
}

boost::asio::awaitable<uint8_t> hash_file(std::filesystem::path path, size_t chunk_size) {
  auto file = co_await open_input(std::move(path));
  co_return co_await hash(file, chunk_size);
}

}  // namespace mpb
