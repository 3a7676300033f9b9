#include "lock_file.hpp"
#include "log.hpp"

#include <utility>

#include <Windows.h>

namespace fmutex {

static std::error_code last_error(DWORD error = GetLastError()) {
  return std::error_code(static_cast<int>(error), std::system_category());
}

// Open the lock file, creating it if needed. Content is left untouched.
static HANDLE open_lock_file(const std::filesystem::path& path) {
  HANDLE handle = CreateFileW(path.c_str(),
                              GENERIC_READ | GENERIC_WRITE,
                              FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                              NULL,
                              OPEN_ALWAYS,
                              FILE_ATTRIBUTE_NORMAL,
                              NULL);
  if (handle == INVALID_HANDLE_VALUE) {
    throw io_error("failed to open lock file: " + path.string(), last_error(), path);
  }
  return handle;
}

// Lock the whole file range
static bool lock_range(HANDLE handle, DWORD flags) {
  OVERLAPPED overlapped = {};
  return LockFileEx(handle, LOCKFILE_EXCLUSIVE_LOCK | flags, 0, MAXDWORD, MAXDWORD, &overlapped);
}

guard::guard(std::filesystem::path&& path, native_handle_type handle) noexcept
    : _path(std::move(path)), _handle(handle) {}

guard::guard(guard&& other) noexcept : _path(std::move(other._path)), _handle(other._handle) {
  other._handle = INVALID_HANDLE_VALUE;
}

guard& guard::operator=(guard&& other) noexcept {
  if (this != &other) {
    if (_handle != INVALID_HANDLE_VALUE) {
      try {
        unlock();
      }
      catch (const std::exception& e) {
        log(log_level::warn) << e.what() << std::endl;
      }
    }
    _path = std::move(other._path);
    _handle = other._handle;
    other._handle = INVALID_HANDLE_VALUE;
  }
  return *this;
}

guard::~guard() {
  if (_handle == INVALID_HANDLE_VALUE) {
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
  if (_handle == INVALID_HANDLE_VALUE) {
    throw exception("lock is not held: " + _path.string());
  }

  HANDLE handle = _handle;
  _handle = INVALID_HANDLE_VALUE;

  OVERLAPPED overlapped = {};
  DWORD unlock_error = UnlockFileEx(handle, 0, MAXDWORD, MAXDWORD, &overlapped) ? ERROR_SUCCESS : GetLastError();
  DWORD close_error = CloseHandle(handle) ? ERROR_SUCCESS : GetLastError();

  if (unlock_error != ERROR_SUCCESS) {
    throw io_error("failed to unlock file: " + _path.string(), last_error(unlock_error), _path);
  }
  if (close_error != ERROR_SUCCESS) {
    throw io_error("failed to close lock file: " + _path.string(), last_error(close_error), _path);
  }

  log(log_level::debug) << "released lock: " << _path.string() << std::endl;
}

guard lock(const std::filesystem::path& path) {
  // Copy the path before opening so nothing can throw between locking and
  // handing the handle to its guard
  std::filesystem::path owned_path = path;
  HANDLE handle = open_lock_file(path);

  if (!lock_range(handle, 0)) {
    DWORD error = GetLastError();
    CloseHandle(handle);
    throw io_error("failed to lock file: " + path.string(), last_error(error), path);
  }

  guard result(std::move(owned_path), handle);
  log(log_level::debug) << "acquired lock: " << path.string() << std::endl;
  return result;
}

std::optional<guard> try_lock(const std::filesystem::path& path) {
  std::filesystem::path owned_path = path;
  HANDLE handle = open_lock_file(path);

  if (!lock_range(handle, LOCKFILE_FAIL_IMMEDIATELY)) {
    DWORD error = GetLastError();
    CloseHandle(handle);
    if (error == ERROR_LOCK_VIOLATION) {
      log(log_level::debug) << "lock is held elsewhere: " << path.string() << std::endl;
      return std::nullopt;
    }
    throw io_error("failed to lock file: " + path.string(), last_error(error), path);
  }

  guard result(std::move(owned_path), handle);
  log(log_level::debug) << "acquired lock: " << path.string() << std::endl;
  return std::move(result);
}

}  // namespace fmutex
