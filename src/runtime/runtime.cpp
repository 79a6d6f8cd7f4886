#include "mpb/runtime/runtime.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "mpb/core/error.hpp"

namespace mpb {

Runtime::Runtime(uint32_t worker_threads) : pool_(worker_threads) {}

Runtime::~Runtime() {
  pool_.stop();
  pool_.join();
}

void Runtime::stop() { pool_.stop(); }

void Runtime::join() { pool_.join(); }

std::unique_ptr<Runtime> make_runtime(const RuntimeConfig& cfg) {
  if (cfg.worker_threads == 0) {
    throw Error{ErrorCode::InvalidArgument, "worker_threads must be > 0"};
  }
  return std::make_unique<Runtime>(cfg.worker_threads);
}

boost::asio::awaitable<std::vector<std::exception_ptr>> join_all(
    std::vector<boost::asio::awaitable<void>> tasks) {
  struct JoinState {
    JoinState(const boost::asio::any_io_executor& ex, size_t n)
        : pending(n), errors(n), done(ex, boost::asio::steady_timer::time_point::max()) {}

    size_t pending;
    std::vector<std::exception_ptr> errors;
    boost::asio::steady_timer done;
  };

  auto ex = co_await boost::asio::this_coro::executor;
  auto state = std::make_shared<JoinState>(ex, tasks.size());

  for (size_t i = 0; i < tasks.size(); ++i) {
    boost::asio::co_spawn(ex, std::move(tasks[i]), [state, i](std::exception_ptr e) {
      state->errors[i] = std::move(e);
      if (--state->pending == 0) {
        state->done.cancel();
      }
    });
  }

  while (state->pending > 0) {
    boost::system::error_code ec;
    co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
  }
  co_return std::move(state->errors);
}

void rethrow_first(const std::vector<std::exception_ptr>& errors) {
  for (const auto& e : errors) {
    if (e) {
      std::rethrow_exception(e);
    }
  }
}

}  // namespace mpb
