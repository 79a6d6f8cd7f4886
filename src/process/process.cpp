#include "mpb/process/process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <fmt/format.h>

#include "mpb/checksum/checksum.hpp"
#include "mpb/core/error.hpp"
#include "mpb/runtime/runtime.hpp"

extern char** environ;

namespace mpb {
namespace {

namespace asio = boost::asio;
using asio::posix::stream_descriptor;

class UniqueFd {
 public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(UniqueFd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
      reset();
      fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
  }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const noexcept { return fd_; }
  int release() noexcept { return std::exchange(fd_, -1); }

  void reset() noexcept {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_{-1};
};

struct Pipe {
  UniqueFd read;
  UniqueFd write;
};

Pipe make_pipe() {
  std::array<int, 2> fds{-1, -1};
  if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
    throw Error{ErrorCode::ProcessSpawnError, fmt::format("pipe failed: {}", std::strerror(errno))};
  }
  return Pipe{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

class SpawnFileActions {
 public:
  SpawnFileActions() { ::posix_spawn_file_actions_init(&actions_); }
  ~SpawnFileActions() { ::posix_spawn_file_actions_destroy(&actions_); }

  SpawnFileActions(const SpawnFileActions&) = delete;
  SpawnFileActions& operator=(const SpawnFileActions&) = delete;

  void open(int fd, const char* path, int flags) {
    check(::posix_spawn_file_actions_addopen(&actions_, fd, path, flags, 0));
  }
  void dup2(int from, int to) { check(::posix_spawn_file_actions_adddup2(&actions_, from, to)); }

  const posix_spawn_file_actions_t* get() const noexcept { return &actions_; }

 private:
  static void check(int rc) {
    if (rc != 0) {
      throw Error{ErrorCode::ProcessSpawnError,
                  fmt::format("posix_spawn file action failed: {}", std::strerror(rc))};
    }
  }

  posix_spawn_file_actions_t actions_{};
};

int reap(pid_t pid) {
  int status = 0;
  for (;;) {
    if (::waitpid(pid, &status, 0) >= 0) {
      return status;
    }
    if (errno != EINTR) {
      throw Error{ErrorCode::Internal, fmt::format("waitpid failed: {}", std::strerror(errno))};
    }
  }
}

// Used on error paths where the child's exit can no longer be awaited.
void kill_and_reap(pid_t pid) {
  ::kill(pid, SIGKILL);
  static_cast<void>(reap(pid));
}

UniqueFd open_pidfd(pid_t pid) {
  const long fd = ::syscall(SYS_pidfd_open, pid, 0);
  if (fd < 0) {
    const int err = errno;
    kill_and_reap(pid);
    throw Error{ErrorCode::ProcessSpawnError, fmt::format("pidfd_open failed: {}", std::strerror(err))};
  }
  ::fcntl(static_cast<int>(fd), F_SETFD, FD_CLOEXEC);
  return UniqueFd{static_cast<int>(fd)};
}

asio::awaitable<void> drain_text(stream_descriptor& pipe, std::string& out) {
  std::array<char, 4096> buffer{};
  for (;;) {
    boost::system::error_code ec;
    const size_t n = co_await pipe.async_read_some(
        asio::buffer(buffer), asio::redirect_error(asio::use_awaitable, ec));
    out.append(buffer.data(), n);
    if (ec == asio::error::eof) {
      co_return;
    }
    if (ec) {
      detail::throw_io_error(ec, "stderr read failed");
    }
  }
}

asio::awaitable<void> hash_output(stream_descriptor& pipe, ChecksumSink& sink) {
  co_await consume_stream(pipe, sink);
}

// The pidfd turns readable once the child has terminated; reaping it then
// never blocks.
asio::awaitable<void> await_exit(stream_descriptor& pidfd, pid_t pid, int& status) {
  boost::system::error_code ec;
  co_await pidfd.async_wait(stream_descriptor::wait_read,
                            asio::redirect_error(asio::use_awaitable, ec));
  if (ec) {
    kill_and_reap(pid);
    detail::throw_io_error(ec, "process exit wait failed");
  }
  status = reap(pid);
}

}  // namespace

asio::awaitable<ProcessOutcome> run_process(ProcessCommand command) {
  if (command.program.empty()) {
    throw Error{ErrorCode::InvalidArgument, "process program is empty"};
  }

  Pipe out = make_pipe();
  Pipe err = make_pipe();

  SpawnFileActions actions;
  actions.open(STDIN_FILENO, "/dev/null", O_RDONLY);
  actions.dup2(out.write.get(), STDOUT_FILENO);
  actions.dup2(err.write.get(), STDERR_FILENO);

  std::vector<char*> argv;
  argv.reserve(command.args.size() + 2);
  argv.push_back(command.program.data());
  for (auto& a : command.args) {
    argv.push_back(a.data());
  }
  argv.push_back(nullptr);

  pid_t pid = -1;
  const int rc = ::posix_spawnp(&pid, command.program.c_str(), actions.get(), nullptr, argv.data(), environ);
  out.write.reset();
  err.write.reset();
  if (rc != 0) {
    throw Error{ErrorCode::ProcessSpawnError,
                fmt::format("failed to spawn {}: {}", command.program, std::strerror(rc))};
  }

  UniqueFd pidfd = open_pidfd(pid);

  auto ex = co_await asio::this_coro::executor;
  stream_descriptor out_pipe(ex, out.read.release());
  stream_descriptor err_pipe(ex, err.read.release());
  stream_descriptor exit_watch(ex, pidfd.release());

  ProcessOutcome outcome{};
  ChecksumSink sink;
  int status = 0;

  std::vector<asio::awaitable<void>> tasks;
  tasks.push_back(await_exit(exit_watch, pid, status));
  tasks.push_back(drain_text(err_pipe, outcome.diagnostics));
  tasks.push_back(hash_output(out_pipe, sink));

  const auto errors = co_await join_all(std::move(tasks));
  rethrow_first(errors);

  if (WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    outcome.exit_code = 128 + WTERMSIG(status);
  }
  outcome.success = WIFEXITED(status) && WEXITSTATUS(status) == 0;
  outcome.checksum = sink.digest();
  outcome.output_bytes = sink.bytes();
  co_return outcome;
}

std::vector<std::string> transcode_args(const std::filesystem::path& input,
                                        std::chrono::duration<double> duration_limit) {
  return {
      "-hide_banner", "-loglevel", "error",
      "-t", fmt::format("{}", duration_limit.count()),
      "-i", input.string(),
      "-c:v", "libx264",
      "-c:a", "aac",
      "-r", "30",
      "-crf", "26",
      "-f", "matroska",
      "-",
  };
}

asio::awaitable<uint8_t> transcode(std::filesystem::path input,
                                   std::chrono::duration<double> duration_limit,
                                   TranscodeOptions opts) {
  ProcessCommand command{};
  command.program = std::move(opts.program);
  command.args = transcode_args(input, duration_limit);

  const auto outcome = co_await run_process(std::move(command));
  if (!outcome.success) {
    throw Error{ErrorCode::ProcessExitError,
                fmt::format("transcoder exited with status {}", outcome.exit_code),
                outcome.diagnostics};
  }
  co_return outcome.checksum;
}

}  // namespace mpb
