#include <notegraph/crypto/hasher.h>
#include <notegraph/identity/identity.h>

#include <spdlog/fmt/fmt.h>

namespace notegraph::identity {

NoteId noteId(std::string_view canonicalPath) {
    std::string key;
    key.reserve(5 + canonicalPath.size());
    key.append("note:").append(canonicalPath);
    return crypto::SHA256Hasher::hashText(key);
}

ImageId imageId(std::string_view noteId, std::string_view relativePath) {
    std::string key;
    key.reserve(7 + noteId.size() + relativePath.size());
    key.append("image:").append(noteId).append("\n").append(relativePath);
    return crypto::SHA256Hasher::hashText(key);
}

std::string chunkId(std::string_view noteId, std::size_t chunkIndex) {
    return fmt::format("{}_{}", noteId, chunkIndex);
}

} // namespace notegraph::identity
