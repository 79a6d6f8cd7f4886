#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mpb/core/types.hpp"

namespace mpb {

struct SampleStats {
  double mean{0.0};
  std::optional<double> stddev{};
  double min{0.0};
  double max{0.0};
};

// Mean and Bessel-corrected sample standard deviation (divisor n - 1). The
// deviation is left empty for fewer than two samples instead of dividing by
// zero.
SampleStats summarize(std::span<const double> samples) noexcept;

class BenchmarkHarness {
 public:
  using Clock = std::chrono::steady_clock;
  using TimeSource = std::function<Clock::time_point()>;
  using Operation = std::function<boost::asio::awaitable<uint8_t>()>;

  BenchmarkHarness();
  explicit BenchmarkHarness(TimeSource now);

  // Runs op iterations times, one after the other, timing each run. A failed
  // run is recorded in BenchmarkResult::failures and the remaining runs still
  // execute. Throws Error{InvalidArgument} for zero iterations.
  boost::asio::awaitable<BenchmarkResult> run(std::string label,
                                              uint32_t iterations,
                                              Operation op) const;

 private:
  TimeSource now_;
};

// One line per result plus one per failed run.
std::string format_report(const BenchmarkResult& result);

// Process exit status for a finished benchmark: 0 when every operation had at
// least one successful run, 1 otherwise. Failed runs of an operation that also
// succeeded are reported but do not fail the benchmark.
int exit_status(std::span<const BenchmarkResult> results) noexcept;

}  // namespace mpb
