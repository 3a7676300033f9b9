#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>

namespace fmutex {

static log_level _log_level = log_level::off;
static std::ostream& _stream(std::cerr);
static std::mutex _mutex;

void set_log_level(log_level level) { _log_level = level; }

log_level parse_log_level(const std::string& name) {
  std::string s = name;
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });

  if (s == "debug") return log_level::debug;
  if (s == "info") return log_level::info;
  if (s == "warn" || s == "warning") return log_level::warn;
  if (s == "error") return log_level::error;
  if (s == "off" || s == "none") return log_level::off;

  throw std::invalid_argument("invalid log level: " + name);
}

// Returns the log stream if enabled, otherwise returns a null stream
mutex_ostream log(log_level level) {
  if (level < _log_level || level == log_level::off) {
    return mutex_ostream();
  }

  mutex_ostream stream(_stream, _mutex);
  switch (level) {
    case log_level::debug:
      stream << "debug - ";
      break;
    case log_level::info:
      stream << "info - ";
      break;
    case log_level::warn:
      stream << "warn - ";
      break;
    case log_level::error:
      stream << "error - ";
      break;
    default:
      break;
  }
  return stream;
}

}  // namespace fmutex
