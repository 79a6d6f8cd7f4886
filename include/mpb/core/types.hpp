#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mpb {

enum class Protocol { RemoteChecksum, Echo };

inline constexpr size_t kDefaultChunkSize = 1024;
inline constexpr uint16_t kDefaultPort = 1144;

struct ProcessOutcome {
  bool success{false};
  int exit_code{-1};
  std::string diagnostics{};
  uint8_t checksum{0};
  uint64_t output_bytes{0};
};

struct IterationFailure {
  uint32_t iteration{};
  std::string message{};
};

struct BenchmarkResult {
  std::string label{};
  std::vector<double> samples{};
  double mean{0.0};
  std::optional<double> stddev{};  // empty with fewer than two samples
  double min{0.0};
  double max{0.0};
  std::optional<uint8_t> last_output{};
  std::vector<IterationFailure> failures{};

  bool ok() const noexcept { return !samples.empty(); }
};

}  // namespace mpb
