#include "mpb/core/log.hpp"

#include <iostream>
#include <mutex>
#include <string>

namespace mpb {
namespace {

std::mutex& log_mutex() {
  static std::mutex mu;
  return mu;
}

const char* prefix(LogLevel level) {
  switch (level) {
    case LogLevel::Info:
      return "[info] ";
    case LogLevel::Warn:
      return "[warn] ";
    case LogLevel::Error:
      return "[error] ";
  }
  return "";
}

}  // namespace

void log_line(LogLevel level, std::string_view message) {
  std::string line{prefix(level)};
  line.append(message);
  line.push_back('\n');

  std::scoped_lock lock(log_mutex());
  std::cerr << line << std::flush;
}

}  // namespace mpb
