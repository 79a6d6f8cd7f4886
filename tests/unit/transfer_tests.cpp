#include <array>
#include <chrono>
#include <cstddef>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>
#include <fmt/format.h>

#include "mpb/checksum/checksum.hpp"
#include "mpb/core/error.hpp"
#include "mpb/net/connection.hpp"
#include "mpb/net/server.hpp"
#include "mpb/net/transfer.hpp"
#include "mpb/runtime/runtime.hpp"
#include "test_support.hpp"

namespace {

namespace asio = boost::asio;
using mpb::tcp;

const std::array<size_t, 5> kSizes{0, 1, mpb::kDefaultChunkSize, 3 * mpb::kDefaultChunkSize + 17,
                                   (1u << 20) + 5};

tcp::endpoint local(uint16_t port) { return tcp::endpoint{asio::ip::address_v4::loopback(), port}; }

mpb::ServerConfig loopback_config(mpb::Protocol protocol) {
  mpb::ServerConfig cfg{};
  cfg.address = "127.0.0.1";
  cfg.port = 0;
  cfg.protocol = protocol;
  return cfg;
}

bool test_remote_checksum_sizes(mpb::Runtime &rt, const mpb::Server &server) {
  for (const size_t size : kSizes) {
    const auto payload = mpb::test::make_payload(size, size + 1);
    mpb::test::TempFile file(fmt::format("checksum_{}.bin", size), payload);
    try {
      const uint8_t got = rt.block_on(mpb::transfer(file.path(), local(server.port()),
                                                    mpb::Protocol::RemoteChecksum));
      const uint8_t want = mpb::test::reference_checksum(payload);
      if (got != want) {
        std::cerr << fmt::format("size {}: got 0x{:02x}, want 0x{:02x}\n", size, got, want);
        return false;
      }
    } catch (const mpb::Error &e) {
      std::cerr << fmt::format("size {}: transfer failed: {}\n", size, mpb::describe(e));
      return false;
    }
  }
  return true;
}

// Sends raw bytes, half-closes and collects everything the server sends back.
asio::awaitable<std::vector<std::byte>> exchange(tcp::endpoint server,
                                                 std::vector<std::byte> payload) {
  mpb::SplitConnection conn(co_await mpb::connect(server));
  mpb::WriteHalf out = conn.writer();
  mpb::ReadHalf in = conn.reader();
  std::vector<std::byte> received;

  auto send = [&]() -> asio::awaitable<void> {
    co_await asio::async_write(out, asio::buffer(payload), asio::use_awaitable);
    out.shutdown();
  };
  auto receive = [&]() -> asio::awaitable<void> {
    std::array<std::byte, 4096> buffer{};
    for (;;) {
      boost::system::error_code ec;
      const size_t n = co_await in.async_read_some(asio::buffer(buffer),
                                                   asio::redirect_error(asio::use_awaitable, ec));
      received.insert(received.end(), buffer.begin(), buffer.begin() + n);
      if (ec == asio::error::eof) {
        co_return;
      }
      if (ec) {
        throw boost::system::system_error(ec);
      }
    }
  };

  std::vector<asio::awaitable<void>> tasks;
  tasks.push_back(send());
  tasks.push_back(receive());
  mpb::rethrow_first(co_await mpb::join_all(std::move(tasks)));
  co_return received;
}

bool test_scenario_5000_byte_pattern(mpb::Runtime &rt, const mpb::Server &server) {
  // 714 whole repetitions of the 7-byte pattern cancel out, leaving 'm' ^ 'p'.
  const auto payload = mpb::test::repeat_pattern("mpbench", 5000);
  const auto reply = rt.block_on(exchange(local(server.port()), payload));
  if (reply.size() != 1 || static_cast<uint8_t>(reply[0]) != 0x1d) {
    std::cerr << fmt::format("expected exactly one byte 0x1d, got {} bytes\n", reply.size());
    return false;
  }
  if (mpb::xor_fold(payload) != 0x1d) {
    std::cerr << fmt::format("local checksum disagrees with the precomputed value\n");
    return false;
  }
  return true;
}

bool test_concurrent_connections(mpb::Runtime &rt, const mpb::Server &server) {
  constexpr size_t kConnections = 12;
  std::vector<std::unique_ptr<mpb::test::TempFile>> files;
  std::vector<uint8_t> expected;
  std::vector<std::future<uint8_t>> results;

  for (size_t i = 0; i < kConnections; ++i) {
    const auto payload = mpb::test::make_payload(200000 + i * 1013, 100 + i);
    expected.push_back(mpb::test::reference_checksum(payload));
    files.push_back(
        std::make_unique<mpb::test::TempFile>(fmt::format("concurrent_{}.bin", i), payload));
  }
  for (size_t i = 0; i < kConnections; ++i) {
    results.push_back(asio::co_spawn(
        rt.make_strand(),
        mpb::transfer(files[i]->path(), local(server.port()), mpb::Protocol::RemoteChecksum),
        asio::use_future));
  }
  for (size_t i = 0; i < kConnections; ++i) {
    try {
      const uint8_t got = results[i].get();
      if (got != expected[i]) {
        std::cerr << fmt::format("connection {}: got 0x{:02x}, want 0x{:02x}\n", i, got,
                                 expected[i]);
        return false;
      }
    } catch (const mpb::Error &e) {
      std::cerr << fmt::format("connection {} failed: {}\n", i, mpb::describe(e));
      return false;
    }
  }
  return true;
}

// A peer that resets mid-stream fails only its own connection.
bool test_failed_connection_is_isolated(mpb::Runtime &rt, const mpb::Server &server) {
  const auto before = server.failed_connections();

  auto reset_mid_stream = [](tcp::endpoint ep) -> asio::awaitable<void> {
    auto socket = co_await mpb::connect(ep);
    const auto payload = mpb::test::make_payload(4096, 9);
    co_await asio::async_write(socket, asio::buffer(payload), asio::use_awaitable);
    socket.set_option(asio::socket_base::linger(true, 0));
    socket.close();
  };
  rt.block_on(reset_mid_stream(local(server.port())));

  const auto payload = mpb::test::make_payload(50000, 21);
  mpb::test::TempFile file("after_reset.bin", payload);
  const uint8_t got = rt.block_on(
      mpb::transfer(file.path(), local(server.port()), mpb::Protocol::RemoteChecksum));
  if (got != mpb::test::reference_checksum(payload)) {
    std::cerr << fmt::format("transfer after a reset peer returned a wrong checksum\n");
    return false;
  }

  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (server.failed_connections() == before && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (server.failed_connections() == before) {
    std::cerr << fmt::format("reset connection was not reported as failed\n");
    return false;
  }
  return true;
}

bool test_echo_mirrors_bytes(mpb::Runtime &rt, const mpb::Server &server) {
  for (const size_t size : kSizes) {
    const auto payload = mpb::test::make_payload(size, size + 7);
    const auto echoed = rt.block_on(exchange(local(server.port()), payload));
    if (echoed != payload) {
      std::cerr << fmt::format("size {}: echoed {} bytes differ from the payload\n", size,
                               echoed.size());
      return false;
    }

    mpb::test::TempFile file(fmt::format("echo_{}.bin", size), payload);
    const uint8_t got =
        rt.block_on(mpb::transfer(file.path(), local(server.port()), mpb::Protocol::Echo));
    if (got != mpb::test::reference_checksum(payload)) {
      std::cerr << fmt::format("size {}: echo checksum 0x{:02x} mismatch\n", size, got);
      return false;
    }
  }
  return true;
}

// A mirroring peer violates the remote-checksum protocol either way: it sends
// nothing for an empty payload and too much for a larger one.
bool test_protocol_violations(mpb::Runtime &rt, const mpb::Server &echo_server) {
  const std::array<size_t, 2> sizes{0, 100};
  for (const size_t size : sizes) {
    const auto payload = mpb::test::make_payload(size, 5);
    mpb::test::TempFile file(fmt::format("violation_{}.bin", size), payload);
    bool rejected = false;
    try {
      static_cast<void>(rt.block_on(mpb::transfer(file.path(), local(echo_server.port()),
                                                  mpb::Protocol::RemoteChecksum)));
    } catch (const mpb::Error &e) {
      rejected = (e.code() == mpb::ErrorCode::ProtocolError);
    }
    if (!rejected) {
      std::cerr << fmt::format("size {}: expected ProtocolError\n", size);
      return false;
    }
  }
  return true;
}

// Without concurrent reading, a mirroring peer and the uploader would both
// block on full socket buffers.
bool test_large_upload_to_mirroring_peer_fails(mpb::Runtime &rt,
                                               const mpb::Server &echo_server) {
  const auto payload = mpb::test::make_payload(8u << 20, 77);
  mpb::test::TempFile file("mirrored_upload.bin", payload);

  auto result = asio::co_spawn(rt.make_strand(),
                               mpb::transfer(file.path(), local(echo_server.port()),
                                             mpb::Protocol::RemoteChecksum),
                               asio::use_future);
  if (result.wait_for(std::chrono::seconds(30)) != std::future_status::ready) {
    std::cerr << fmt::format("checksum transfer against a mirroring peer did not finish\n");
    return false;
  }

  bool rejected = false;
  try {
    static_cast<void>(result.get());
  } catch (const mpb::Error &e) {
    rejected = (e.code() == mpb::ErrorCode::ProtocolError);
    if (!rejected) {
      std::cerr << fmt::format("unexpected error: {}\n", mpb::describe(e));
    }
  }
  if (!rejected) {
    std::cerr << fmt::format("expected ProtocolError for an early reply\n");
    return false;
  }
  return true;
}

template <typename Predicate>
bool wait_until(Predicate done) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!done() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return done();
}

asio::awaitable<uint8_t> finish_upload(tcp::socket socket) {
  mpb::SplitConnection conn(std::move(socket));
  conn.writer().shutdown();
  mpb::ReadHalf in = conn.reader();
  std::array<std::byte, 1> reply{};
  co_await asio::async_read(in, asio::buffer(reply), asio::use_awaitable);
  co_return static_cast<uint8_t>(reply[0]);
}

bool test_connection_limit(mpb::Runtime &rt) {
  auto cfg = loopback_config(mpb::Protocol::RemoteChecksum);
  cfg.max_connections = 1;
  mpb::Server server(rt, cfg);
  server.start();

  tcp::socket held = rt.block_on(mpb::connect(local(server.port())));
  if (!wait_until([&] { return server.active_connections() == 1; })) {
    std::cerr << fmt::format("first connection was not accepted\n");
    return false;
  }

  const std::vector<std::byte> empty;
  mpb::test::TempFile file("over_limit.bin", empty);
  bool refused = false;
  try {
    static_cast<void>(rt.block_on(mpb::transfer(file.path(), local(server.port()))));
  } catch (const mpb::Error &e) {
    refused = (e.code() == mpb::ErrorCode::ProtocolError);
    if (!refused) {
      std::cerr << fmt::format("unexpected error: {}\n", mpb::describe(e));
    }
  }
  if (!refused) {
    std::cerr << fmt::format("connection over the limit was served\n");
    return false;
  }

  const uint8_t held_checksum = rt.block_on(finish_upload(std::move(held)));
  if (held_checksum != 0) {
    std::cerr << fmt::format("held connection got 0x{:02x}\n", held_checksum);
    return false;
  }
  if (!wait_until([&] {
        return server.active_connections() == 0 && server.completed_connections() == 1;
      })) {
    std::cerr << fmt::format("held connection did not release its slot\n");
    return false;
  }

  const auto payload = mpb::test::make_payload(3000, 3);
  mpb::test::TempFile after("after_limit.bin", payload);
  const uint8_t got = rt.block_on(mpb::transfer(after.path(), local(server.port())));
  if (got != mpb::test::reference_checksum(payload)) {
    std::cerr << fmt::format("transfer after the slot was freed returned 0x{:02x}\n", got);
    return false;
  }
  return true;
}

// Accepts one connection, reads it to the end and mirrors all but the last byte.
asio::awaitable<void> serve_truncated_echo(tcp::acceptor &acceptor) {
  tcp::socket socket = co_await acceptor.async_accept(asio::use_awaitable);
  std::vector<std::byte> received;
  std::array<std::byte, 4096> buffer{};
  for (;;) {
    boost::system::error_code ec;
    const size_t n = co_await socket.async_read_some(
        asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
    received.insert(received.end(), buffer.begin(), buffer.begin() + n);
    if (ec == asio::error::eof) {
      break;
    }
    if (ec) {
      throw boost::system::system_error(ec);
    }
  }
  if (!received.empty()) {
    received.pop_back();
  }
  co_await asio::async_write(socket, asio::buffer(received), asio::use_awaitable);
  socket.shutdown(tcp::socket::shutdown_send);
}

bool test_truncated_echo_is_rejected(mpb::Runtime &rt) {
  auto strand = rt.make_strand();
  tcp::acceptor acceptor(strand, local(0));
  auto peer = asio::co_spawn(strand, serve_truncated_echo(acceptor), asio::use_future);

  const auto payload = mpb::test::make_payload(10000, 13);
  mpb::test::TempFile file("truncated_echo.bin", payload);
  bool rejected = false;
  try {
    static_cast<void>(rt.block_on(mpb::transfer(file.path(),
                                                local(acceptor.local_endpoint().port()),
                                                mpb::Protocol::Echo)));
  } catch (const mpb::Error &e) {
    rejected = (e.code() == mpb::ErrorCode::ProtocolError);
    if (!rejected) {
      std::cerr << fmt::format("unexpected error: {}\n", mpb::describe(e));
    }
  }

  try {
    peer.get();
  } catch (const boost::system::system_error &e) {
    std::cerr << fmt::format("truncating peer failed: {}\n", e.what());
    return false;
  }
  if (!rejected) {
    std::cerr << fmt::format("expected ProtocolError for a truncated echo\n");
    return false;
  }
  return true;
}

bool test_connect_error(mpb::Runtime &rt) {
  uint16_t unused_port = 0;
  {
    mpb::Server probe(rt, loopback_config(mpb::Protocol::RemoteChecksum));
    unused_port = probe.port();
  }
  // The probe's acceptor closes asynchronously.
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  const auto payload = mpb::test::make_payload(16, 1);
  mpb::test::TempFile file("connect_error.bin", payload);
  bool rejected = false;
  try {
    static_cast<void>(rt.block_on(mpb::transfer(file.path(), local(unused_port))));
  } catch (const mpb::Error &e) {
    rejected = (e.code() == mpb::ErrorCode::ConnectError);
  }
  if (!rejected) {
    std::cerr << fmt::format("expected ConnectError for port {}\n", unused_port);
    return false;
  }
  return true;
}

bool test_missing_input_is_io_error(mpb::Runtime &rt, const mpb::Server &server) {
  bool rejected = false;
  try {
    static_cast<void>(rt.block_on(mpb::transfer("/nonexistent/mpb/input.mkv", local(server.port()))));
  } catch (const mpb::Error &e) {
    rejected = (e.code() == mpb::ErrorCode::IoError);
  }
  if (!rejected) {
    std::cerr << fmt::format("expected IoError for a missing input file\n");
    return false;
  }
  return true;
}

} // namespace

int main() {
  auto rt = mpb::make_runtime(mpb::RuntimeConfig{4});

  try {
    mpb::Server checksum_server(*rt, loopback_config(mpb::Protocol::RemoteChecksum));
    mpb::Server echo_server(*rt, loopback_config(mpb::Protocol::Echo));
    checksum_server.start();
    echo_server.start();

    if (!test_remote_checksum_sizes(*rt, checksum_server)) {
      return 1;
    }
    if (!test_scenario_5000_byte_pattern(*rt, checksum_server)) {
      return 1;
    }
    if (!test_concurrent_connections(*rt, checksum_server)) {
      return 1;
    }
    if (!test_failed_connection_is_isolated(*rt, checksum_server)) {
      return 1;
    }
    if (!test_echo_mirrors_bytes(*rt, echo_server)) {
      return 1;
    }
    if (!test_protocol_violations(*rt, echo_server)) {
      return 1;
    }
    if (!test_large_upload_to_mirroring_peer_fails(*rt, echo_server)) {
      return 1;
    }
    if (!test_missing_input_is_io_error(*rt, checksum_server)) {
      return 1;
    }
  } catch (const mpb::Error &e) {
    std::cerr << fmt::format("server setup failed: {}\n", mpb::describe(e));
    return 1;
  }

  try {
    if (!test_connection_limit(*rt)) {
      return 1;
    }
  } catch (const mpb::Error &e) {
    std::cerr << fmt::format("connection limit setup failed: {}\n", mpb::describe(e));
    return 1;
  }
  if (!test_truncated_echo_is_rejected(*rt)) {
    return 1;
  }
  if (!test_connect_error(*rt)) {
    return 1;
  }
  return 0;
}
