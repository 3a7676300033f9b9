#pragma once

#include "exception.hpp"

#include <filesystem>
#include <optional>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fmutex {

// An exclusive advisory lock held on a file.
//
// A guard is only created by lock() or try_lock(). It owns the open handle on
// the lock file and releases the lock, then closes the handle, when it is
// destroyed. Guards can be moved but not copied.
//
// Locks are advisory: they only exclude other callers of lock()/try_lock()
// (or any other flock()/LockFileEx() user). The file itself is never read,
// written or removed.
//
// Platform notes:
// - On POSIX the lock is taken with flock(2) and belongs to the open file
//   description. Each lock()/try_lock() call opens the file anew, so two calls
//   in the same process exclude each other. The lock is not re-entrant: a
//   second blocking lock() on the same path from the holding thread never
//   returns.
// - A child created by fork() shares the description, and with it the lock,
//   until the holder releases it. The descriptor is close-on-exec, so programs
//   started with exec() do not inherit it.
// - flock() over network filesystems may be emulated or unsupported.
// - On Windows the whole file range is locked with LockFileEx(). Such locks
//   are per handle and mandatory for the locked range.
//
// The platform releases the lock if the holding process dies.
class guard {
 public:
#ifdef _WIN32
  using native_handle_type = HANDLE;
#else
  using native_handle_type = int;
#endif

  guard(guard&& other) noexcept;
  guard& operator=(guard&& other) noexcept;

  guard(const guard&) = delete;
  guard& operator=(const guard&) = delete;

  // Releases the lock and closes the file. Errors are logged, never thrown.
  ~guard();

  // Release the lock and close the file now. Throws io_error if either step
  // fails, and exception if the guard no longer holds a lock.
  void unlock();

 private:
  friend guard lock(const std::filesystem::path& path);
  friend std::optional<guard> try_lock(const std::filesystem::path& path);

  guard(std::filesystem::path&& path, native_handle_type handle) noexcept;

  std::filesystem::path _path;
  native_handle_type _handle;
};

// Acquire the lock on path, blocking the calling thread until it is available.
// The file is created if it does not exist. Throws io_error if the file cannot
// be opened or locked.
guard lock(const std::filesystem::path& path);

// Attempt to acquire the lock on path without blocking. Returns std::nullopt
// if another holder owns the lock. Throws io_error if the file cannot be opened
// or the lock request fails for any other reason.
std::optional<guard> try_lock(const std::filesystem::path& path);

}  // namespace fmutex
