#pragma once

#include <iostream>
#include <mutex>

namespace fmutex {

// An output stream that holds a mutex for as long as it lives, so that
// statements written through it from different threads do not interleave.
// A default constructed mutex_ostream has no buffer and discards all output.

class mutex_ostream : public std::ostream {
  std::unique_lock<std::mutex> _lock;

 public:
  mutex_ostream() : std::ostream(nullptr) {}

  // Construct a mutex_ostream from an existing std::ostream and a mutex
  mutex_ostream(std::ostream& stream, std::mutex& mutex) : std::ostream(stream.rdbuf()), _lock(mutex) {}

  // Move constructor
  mutex_ostream(mutex_ostream&& other) : std::ostream(other.rdbuf()), _lock(std::move(other._lock)) {}
};

}  // namespace fmutex
