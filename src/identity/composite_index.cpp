#include <notegraph/identity/composite_index.h>
#include <notegraph/identity/identity.h>

#include <mutex>

namespace notegraph::identity {

std::string CompositeIndex::makeKey(std::string_view noteId, std::string_view relativePath) {
    // Note ids are hex, so the separator cannot occur inside the first component
    std::string key;
    key.reserve(noteId.size() + 1 + relativePath.size());
    key.append(noteId).push_back('\n');
    key.append(relativePath);
    return key;
}

ImageId CompositeIndex::lookup(std::string_view noteId, std::string_view relativePath) {
    auto key = makeKey(noteId, relativePath);
    {
        std::shared_lock lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end()) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            return it->second;
        }
    }

    misses_.fetch_add(1, std::memory_order_relaxed);
    auto id = imageId(noteId, relativePath);

    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(std::move(key), std::move(id));
    return it->second;
}

std::optional<ImageId> CompositeIndex::peek(std::string_view noteId,
                                            std::string_view relativePath) const {
    std::shared_lock lock(mutex_);
    if (auto it = entries_.find(makeKey(noteId, relativePath)); it != entries_.end()) {
        return it->second;
    }
    return std::nullopt;
}

size_t CompositeIndex::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

void CompositeIndex::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
}

std::map<std::pair<std::string, std::string>, ImageId> CompositeIndex::snapshot() const {
    std::map<std::pair<std::string, std::string>, ImageId> out;
    std::shared_lock lock(mutex_);
    for (const auto& [key, id] : entries_) {
        auto sep = key.find('\n');
        out.emplace(std::make_pair(key.substr(0, sep), key.substr(sep + 1)), id);
    }
    return out;
}

} // namespace notegraph::identity
