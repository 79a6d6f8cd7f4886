#include "mpb/bench/harness.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <numeric>
#include <utility>

#include <fmt/format.h>

#include "mpb/core/error.hpp"

namespace mpb {

SampleStats summarize(std::span<const double> samples) noexcept {
  SampleStats out{};
  if (samples.empty()) {
    return out;
  }

  const auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
  out.min = *lo;
  out.max = *hi;

  const double n = static_cast<double>(samples.size());
  out.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;

  if (samples.size() < 2) {
    return out;
  }
  double sq_sum = 0.0;
  for (const double s : samples) {
    sq_sum += (s - out.mean) * (s - out.mean);
  }
  out.stddev = std::sqrt(sq_sum / (n - 1.0));
  return out;
}

BenchmarkHarness::BenchmarkHarness() : now_([]() { return Clock::now(); }) {}

BenchmarkHarness::BenchmarkHarness(TimeSource now) : now_(std::move(now)) {}

boost::asio::awaitable<BenchmarkResult> BenchmarkHarness::run(std::string label,
                                                              uint32_t iterations,
                                                              Operation op) const {
  if (iterations == 0) {
    throw Error{ErrorCode::InvalidArgument, "iterations must be > 0"};
  }

  BenchmarkResult result{};
  result.label = std::move(label);
  result.samples.reserve(iterations);

  for (uint32_t i = 0; i < iterations; ++i) {
    std::string failure;
    const auto start = now_();
    try {
      const uint8_t output = co_await op();
      const auto stop = now_();
      result.samples.push_back(std::chrono::duration<double>(stop - start).count());
      result.last_output = output;
      continue;
    } catch (const Error& e) {
      failure = describe(e);
    } catch (const std::exception& e) {
      failure = e.what();
    }
    result.failures.push_back(IterationFailure{i, std::move(failure)});
  }

  const auto stats = summarize(result.samples);
  result.mean = stats.mean;
  result.stddev = stats.stddev;
  result.min = stats.min;
  result.max = stats.max;
  co_return result;
}

std::string format_report(const BenchmarkResult& result) {
  std::string out;
  if (result.ok()) {
    const std::string dev =
        result.stddev ? fmt::format("{:.3f}", *result.stddev) : std::string{"undefined"};
    out += fmt::format("{} in {:.3f} s ± {} s over {} run{} (min {:.3f} s, max {:.3f} s)",
                       result.label, result.mean, dev, result.samples.size(),
                       result.samples.size() == 1 ? "" : "s", result.min, result.max);
    if (result.last_output) {
      out += fmt::format(" (got 0x{:02x})", *result.last_output);
    }
    out += "\n";
  }
  for (const auto& f : result.failures) {
    out += fmt::format("{} failed on run {}: {}\n", result.label, f.iteration + 1, f.message);
  }
  return out;
}

int exit_status(std::span<const BenchmarkResult> results) noexcept {
  for (const auto& r : results) {
    if (!r.ok()) {
      return 1;
    }
  }
  return 0;
}

}  // namespace mpb
