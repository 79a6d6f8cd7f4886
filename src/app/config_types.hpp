#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "mpb/core/types.hpp"

namespace mpb::app {

enum class Command { Benchmark, Server };

struct Config {
  Command command{Command::Benchmark};
  Protocol protocol{Protocol::RemoteChecksum};

  // benchmark
  std::vector<std::filesystem::path> files;
  double transcode_seconds{30.0};
  uint16_t port{kDefaultPort};
  std::optional<std::string> remote_ip;
  uint32_t iterations{1};
  std::string ffmpeg{"ffmpeg"};

  // server
  std::string listen_address{"0.0.0.0"};
  uint32_t max_connections{0};

  uint32_t threads{std::max(1u, std::thread::hardware_concurrency())};
};

}  // namespace mpb::app
