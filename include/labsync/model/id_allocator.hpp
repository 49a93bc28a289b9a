#pragma once

#include <cstdint>
#include <mutex>

namespace labsync::model {

/**
 * @brief Running-maximum id source
 *
 * Ids are handed out as max + 1 and the maximum is never lowered, so an id
 * stays unique for the life of the allocator even after the record that
 * carried it has been discarded by a rescan.
 */
class IdAllocator {
public:
    IdAllocator() = default;
    IdAllocator(const IdAllocator&) = delete;
    IdAllocator& operator=(const IdAllocator&) = delete;

    std::uint64_t next() {
        std::lock_guard lock(mutex_);
        return ++max_;
    }

    /// Raise the maximum to cover an id assigned elsewhere.
    void observe(std::uint64_t id) {
        std::lock_guard lock(mutex_);
        if (id > max_) {
            max_ = id;
        }
    }

    [[nodiscard]] std::uint64_t current_max() const {
        std::lock_guard lock(mutex_);
        return max_;
    }

private:
    mutable std::mutex mutex_;
    std::uint64_t max_ = 0;
};

} // namespace labsync::model
