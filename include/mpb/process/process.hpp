#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "mpb/core/types.hpp"

namespace mpb {

struct ProcessCommand {
  std::string program{};  // looked up in PATH when it has no slash
  std::vector<std::string> args{};
};

// Spawns command.program with stdin on /dev/null and concurrently drains stderr,
// hashes stdout and awaits the exit status. Throws Error{ProcessSpawnError}
// when the program cannot be started and Error{IoError} when a pipe read
// fails. A non-zero exit is reported through ProcessOutcome::success.
boost::asio::awaitable<ProcessOutcome> run_process(ProcessCommand command);

struct TranscodeOptions {
  std::string program{"ffmpeg"};
};

std::vector<std::string> transcode_args(const std::filesystem::path& input,
                                        std::chrono::duration<double> duration_limit);

// Transcodes at most duration_limit of input to matroska on stdout and returns
// the checksum of the encoded stream. A failing tool raises
// Error{ProcessExitError} whose detail() holds the tool's stderr.
boost::asio::awaitable<uint8_t> transcode(std::filesystem::path input,
                                          std::chrono::duration<double> duration_limit,
                                          TranscodeOptions opts = {});

}  // namespace mpb
