#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fmutex {

class exception : public std::runtime_error {
 public:
  explicit exception(const std::string& message) : std::runtime_error(message) {}
};

// Raised when the platform fails to open, lock, unlock or close a file.
// Carries the platform error code and, where known, the file involved.
class io_error : public exception {
 public:
  io_error(const std::string& message, std::error_code code, const std::filesystem::path& path = {})
      : exception(message + ": " + code.message()), _code(code), _path(path) {}

  const std::error_code& code() const noexcept { return _code; }
  const std::filesystem::path& path() const noexcept { return _path; }

 private:
  std::error_code _code;
  std::filesystem::path _path;
};

}  // namespace fmutex
