#pragma once

#include "lock_file.hpp"

#include <filesystem>
#include <optional>
#include <utility>

namespace fmutex {

// Lock holder exposed to Python. Python code can call unlock() and then leave
// a with-block, so the guard is kept in an optional that __exit__ may find
// already empty.
class held_lock {
public:
    explicit held_lock(guard&& g) : _guard(std::move(g)) {}

    // Release now, raising on failure
    void unlock();

    // Release if still held, never raising
    void release() noexcept;

private:
    std::optional<guard> _guard;
};

std::optional<held_lock> try_lock_held(const std::filesystem::path& path);
held_lock lock_held(const std::filesystem::path& path);

} // namespace fmutex
