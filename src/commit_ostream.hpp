#pragma once

#include <functional>
#include <sstream>
#include <string>

namespace fmutex {

// A string stream that hands its complete contents to a commit function when
// it is destroyed. Used to write whole lines to a shared stream at once.

class commit_ostream : public std::ostringstream {
  std::function<void(const std::string&)> _commit;

 public:
  commit_ostream();
  virtual ~commit_ostream();

  // Construct a commit_ostream that calls commit on destruction
  commit_ostream(std::function<void(const std::string&)> commit);

  // Move constructor
  commit_ostream(commit_ostream&& other);
};

}  // namespace fmutex
