#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <utility>
#include <vector>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

namespace mpb {

struct RuntimeConfig {
  uint32_t worker_threads{};
};

// Worker pool that multiplexes coroutine tasks. Every top-level task gets its
// own strand, so the tasks it fans out never run in parallel with each other
// and need no locking.
class Runtime {
 public:
  using executor_type = boost::asio::thread_pool::executor_type;

  explicit Runtime(uint32_t worker_threads);
  ~Runtime();

  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;

  executor_type get_executor() noexcept { return pool_.get_executor(); }
  boost::asio::strand<executor_type> make_strand() { return boost::asio::make_strand(pool_); }

  // Runs task to completion on a fresh strand and returns its result or
  // rethrows its exception. Must not be called from a worker thread.
  template <typename T>
  T block_on(boost::asio::awaitable<T> task) {
    auto fut = boost::asio::co_spawn(make_strand(), std::move(task), boost::asio::use_future);
    return fut.get();
  }

  void stop();
  void join();

 private:
  boost::asio::thread_pool pool_;
};

std::unique_ptr<Runtime> make_runtime(const RuntimeConfig& cfg);

// Starts every task concurrently on the calling coroutine's executor and
// resumes only after all of them completed, successfully or not. The result
// holds one entry per task, in task order, null on success. The caller must
// run on a strand.
boost::asio::awaitable<std::vector<std::exception_ptr>> join_all(
    std::vector<boost::asio::awaitable<void>> tasks);

void rethrow_first(const std::vector<std::exception_ptr>& errors);

}  // namespace mpb
