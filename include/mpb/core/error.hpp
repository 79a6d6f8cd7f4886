#pragma once

#include <exception>
#include <string>
#include <utility>

namespace mpb {

enum class ErrorCode {
  InvalidArgument,
  ConnectError,
  IoError,
  ProcessSpawnError,
  ProcessExitError,
  ProtocolError,
  Internal,
};

const char* to_string(ErrorCode code) noexcept;

class Error : public std::exception {
  ErrorCode code_{ErrorCode::Internal};
  std::string message_{};
  std::string detail_{};

public:
  Error() = default;
  Error(ErrorCode c, std::string m) : code_(c), message_(std::move(m)) {}
  Error(ErrorCode c, std::string m, std::string d)
      : code_(c), message_(std::move(m)), detail_(std::move(d)) {}
  explicit Error(std::string m) : message_(std::move(m)) {}

  const char *what() const noexcept override { return message_.c_str(); }

  ErrorCode code() const noexcept { return code_; }

  // Captured diagnostic text, e.g. the stderr of a failed subprocess.
  const std::string& detail() const noexcept { return detail_; }
};

// Maps an arbitrary exception onto the error taxonomy: Error is kept as is,
// Boost system errors become IoError and anything else Internal.
Error classify(const std::exception& e);

// Message plus detail, on separate lines when a detail is present.
std::string describe(const Error& e);

} // namespace mpb
