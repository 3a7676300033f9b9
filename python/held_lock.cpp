#include "held_lock.hpp"

#include <utility>

namespace fmutex {

void held_lock::unlock() {
    if (!_guard) {
        throw exception("lock is not held");
    }
    guard g = std::move(*_guard);
    _guard.reset();
    g.unlock();
}

void held_lock::release() noexcept {
    // The guard destructor logs release errors
    _guard.reset();
}

held_lock lock_held(const std::filesystem::path& path) {
    return held_lock(lock(path));
}

std::optional<held_lock> try_lock_held(const std::filesystem::path& path) {
    std::optional<guard> g = try_lock(path);
    if (!g) {
        return std::nullopt;
    }
    return held_lock(std::move(*g));
}

} // namespace fmutex
