#include "mpb/core/error.hpp"

#include <boost/system/system_error.hpp>

namespace mpb {

const char* to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::InvalidArgument:
      return "invalid argument";
    case ErrorCode::ConnectError:
      return "connect error";
    case ErrorCode::IoError:
      return "i/o error";
    case ErrorCode::ProcessSpawnError:
      return "process spawn error";
    case ErrorCode::ProcessExitError:
      return "process exit error";
    case ErrorCode::ProtocolError:
      return "protocol error";
    case ErrorCode::Internal:
      return "internal error";
  }
  return "unknown error";
}

Error classify(const std::exception& e) {
  if (const auto* err = dynamic_cast<const Error*>(&e)) {
    return *err;
  }
  if (dynamic_cast<const boost::system::system_error*>(&e) != nullptr) {
    return Error{ErrorCode::IoError, e.what()};
  }
  return Error{ErrorCode::Internal, e.what()};
}

std::string describe(const Error& e) {
  std::string out = std::string(to_string(e.code())) + ": " + e.what();
  if (!e.detail().empty()) {
    out += "\n";
    out += e.detail();
  }
  return out;
}

}  // namespace mpb
