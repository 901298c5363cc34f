#pragma once

#include <notegraph/core/types.h>

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace notegraph::identity {

/**
 * @brief Thread-safe (note_id, relative_path) -> image_id index
 *
 * Read-through: a lookup that misses derives the id and inserts it if no other
 * thread got there first. Entries are pure functions of their key, so the cache can
 * be cleared at any time without changing results.
 */
class CompositeIndex {
public:
    CompositeIndex() = default;

    CompositeIndex(const CompositeIndex&) = delete;
    CompositeIndex& operator=(const CompositeIndex&) = delete;

    /**
     * @brief Image id for an image referenced from a note
     */
    ImageId lookup(std::string_view noteId, std::string_view relativePath);

    /**
     * @brief Cached id without computing on miss; does not touch statistics
     */
    std::optional<ImageId> peek(std::string_view noteId, std::string_view relativePath) const;

    size_t size() const;
    uint64_t hits() const { return hits_.load(std::memory_order_relaxed); }
    uint64_t misses() const { return misses_.load(std::memory_order_relaxed); }

    void clear();

    /**
     * @brief Sorted copy of every cached entry, keyed by (note_id, relative_path)
     */
    std::map<std::pair<std::string, std::string>, ImageId> snapshot() const;

private:
    static std::string makeKey(std::string_view noteId, std::string_view relativePath);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, ImageId> entries_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
};

} // namespace notegraph::identity
