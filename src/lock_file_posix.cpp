#include "lock_file.hpp"
#include "log.hpp"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fmutex {

static std::error_code last_error(int error = errno) { return std::error_code(error, std::system_category()); }

// Open the lock file, creating it if needed. Content is left untouched.
static int open_lock_file(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0666);
  if (fd == -1) {
    throw io_error("failed to open lock file: " + path.string(), last_error(), path);
  }
  return fd;
}

// flock() that retries when interrupted by a signal
static int flock_retry(int fd, int operation) {
  int ret;
  do {
    ret = ::flock(fd, operation);
  } while (ret == -1 && errno == EINTR);
  return ret;
}

guard::guard(std::filesystem::path&& path, native_handle_type handle) noexcept
    : _path(std::move(path)), _handle(handle) {}

guard::guard(guard&& other) noexcept : _path(std::move(other._path)), _handle(other._handle) { other._handle = -1; }

guard& guard::operator=(guard&& other) noexcept {
  if (this != &other) {
    if (_handle != -1) {
      try {
        unlock();
      }
      catch (const std::exception& e) {
        log(log_level::warn) << e.what() << std::endl;
      }
    }
    _path = std::move(other._path);
    _handle = other._handle;
    other._handle = -1;
  }
  return *this;
}

guard::~guard() {
  if (_handle == -1) {
    return;
  }

  try {
    unlock();
  }
  catch (const std::exception& e) {
    log(log_level::warn) << e.what() << std::endl;
  }
}

void guard::unlock() {
  if (_handle == -1) {
    throw exception("lock is not held: " + _path.string());
  }

  int fd = _handle;
  _handle = -1;

  int unlock_error = ::flock(fd, LOCK_UN) == -1 ? errno : 0;
  int close_error = ::close(fd) == -1 ? errno : 0;

  if (unlock_error != 0) {
    throw io_error("failed to unlock file: " + _path.string(), last_error(unlock_error), _path);
  }
  if (close_error != 0) {
    throw io_error("failed to close lock file: " + _path.string(), last_error(close_error), _path);
  }

  log(log_level::debug) << "released lock: " << _path.string() << std::endl;
}

guard lock(const std::filesystem::path& path) {
  // Copy the path before opening so nothing can throw between locking and
  // handing the fd to its guard
  std::filesystem::path owned_path = path;
  int fd = open_lock_file(path);

  if (flock_retry(fd, LOCK_EX) == -1) {
    int error = errno;
    ::close(fd);
    throw io_error("failed to lock file: " + path.string(), last_error(error), path);
  }

  guard result(std::move(owned_path), fd);
  log(log_level::debug) << "acquired lock: " << path.string() << std::endl;
  return result;
}

std::optional<guard> try_lock(const std::filesystem::path& path) {
  std::filesystem::path owned_path = path;
  int fd = open_lock_file(path);

  if (flock_retry(fd, LOCK_EX | LOCK_NB) == -1) {
    int error = errno;
    ::close(fd);
    if (error == EWOULDBLOCK) {
      log(log_level::debug) << "lock is held elsewhere: " << path.string() << std::endl;
      return std::nullopt;
    }
    throw io_error("failed to lock file: " + path.string(), last_error(error), path);
  }

  guard result(std::move(owned_path), fd);
  log(log_level::debug) << "acquired lock: " << path.string() << std::endl;
  return std::move(result);
}

}  // namespace fmutex
