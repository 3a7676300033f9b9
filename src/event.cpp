#include "event.hpp"

#include <cstdio>
#include <iostream>
#include <mutex>
#include <ostream>
#include <string>

namespace fmutex {

static bool _events_enabled = false;
static std::ostream& _stream(std::cerr);
static std::mutex _mutex;

void set_events_enabled(bool enabled) { _events_enabled = enabled; }

std::string escape(const std::string& str) {
  std::string escaped_str;
  for (char c : str) {
    switch (c) {
      case '\"':
        escaped_str += "\\\"";
        break;
      case '\\':
        escaped_str += "\\\\";
        break;
      case '\b':
        escaped_str += "\\b";
        break;
      case '\f':
        escaped_str += "\\f";
        break;
      case '\n':
        escaped_str += "\\n";
        break;
      case '\r':
        escaped_str += "\\r";
        break;
      case '\t':
        escaped_str += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[7];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          escaped_str += buf;
        }
        else {
          escaped_str += c;
        }
        break;
    }
  }
  return escaped_str;
}

static commit_ostream event_stream() {
  return commit_ostream([](const std::string& message) {
    std::lock_guard<std::mutex> lock(_mutex);
    _stream << message << std::flush;
  });
}

// Emit an event in JSON format
void event(const std::string& type, const std::string& path, const std::string& message) {
  if (!_events_enabled) {
    return;
  }

  commit_ostream stream = event_stream();
  stream << "{ \"type\": \"" << escape(type) << "\", \"path\": \"" << escape(path) << "\"";
  if (!message.empty()) {
    stream << ", \"message\": \"" << escape(message) << "\"";
  }
  stream << " }\n";
}

void event(const std::string& type, const std::string& path, long long value) {
  if (!_events_enabled) {
    return;
  }

  commit_ostream stream = event_stream();
  stream << "{ \"type\": \"" << escape(type) << "\", \"path\": \"" << escape(path) << "\", \"value\": " << value
         << " }\n";
}

}  // namespace fmutex
