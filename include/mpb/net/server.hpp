#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "mpb/core/expected.hpp"
#include "mpb/core/types.hpp"
#include "mpb/net/connection.hpp"
#include "mpb/runtime/runtime.hpp"

namespace mpb {

// Mirrors every inbound byte back until the peer half-closes.
class EchoHandler {
 public:
  explicit EchoHandler(tcp::socket socket) : conn_(std::move(socket)) {}

  // Returns the number of bytes mirrored.
  boost::asio::awaitable<uint64_t> run();

 private:
  SplitConnection conn_;
};

enum class HandlerState { Reading, Computed, Responding, Closed };

const char* to_string(HandlerState state) noexcept;

// Hashes every inbound byte until the peer half-closes, then replies with the
// single checksum byte.
class ChecksumHandler {
 public:
  explicit ChecksumHandler(tcp::socket socket) : conn_(std::move(socket)) {}

  boost::asio::awaitable<uint8_t> run();

  HandlerState state() const noexcept { return state_; }
  uint64_t bytes() const noexcept { return bytes_; }

 private:
  SplitConnection conn_;
  HandlerState state_{HandlerState::Reading};
  uint64_t bytes_{0};
};

struct SessionReport {
  uint64_t bytes{0};
  std::optional<uint8_t> checksum{};
};

// Runs the handler for protocol and converts any failure into an error value;
// nothing thrown by the handler escapes.
boost::asio::awaitable<Expected<SessionReport>> handle_connection(tcp::socket socket,
                                                                  Protocol protocol);

struct ServerConfig {
  std::string address{"0.0.0.0"};
  uint16_t port{kDefaultPort};  // 0 binds an ephemeral port
  Protocol protocol{Protocol::RemoteChecksum};
  uint32_t max_connections{0};  // 0 means unlimited
};

// Accept loop spawning one handler per connection, each on its own strand.
// Must be destroyed before the Runtime it runs on.
class Server {
 public:
  // Binds and listens immediately. Throws Error{IoError}.
  Server(Runtime& runtime, const ServerConfig& cfg);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  uint16_t port() const noexcept { return port_; }

  void start();
  void stop();

  uint64_t active_connections() const noexcept;
  uint64_t completed_connections() const noexcept;
  uint64_t failed_connections() const noexcept;

 private:
  struct State;

  static boost::asio::awaitable<void> accept_loop(std::shared_ptr<State> state);
  static boost::asio::awaitable<void> run_session(std::shared_ptr<State> state,
                                                  tcp::socket socket,
                                                  std::string peer);

  std::shared_ptr<State> state_;
  uint16_t port_{0};
};

}  // namespace mpb
