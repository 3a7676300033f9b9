#pragma once

#include "commit_ostream.hpp"

#include <cstddef>
#include <string>

namespace fmutex {

// JSON lifecycle events, one object per line on stderr. Disabled by default.
void set_events_enabled(bool enabled = true);
void event(const std::string& type, const std::string& path, const std::string& message = "");
void event(const std::string& type, const std::string& path, long long value);

// Escape string for JSON
std::string escape(const std::string& str);

}  // namespace fmutex
