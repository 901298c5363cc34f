#pragma once

#include <notegraph/core/types.h>

#include <string_view>

namespace notegraph::identity {

/**
 * Deterministic identities. Both are SHA-256 over a domain-prefixed key, rendered as
 * 64 lowercase hex characters, so a note id can never collide with an image id built
 * from the same text.
 */
NoteId noteId(std::string_view canonicalPath);
ImageId imageId(std::string_view noteId, std::string_view relativePath);

// Chunk ids are derived, not hashed: "<note_id>_<chunk_index>"
std::string chunkId(std::string_view noteId, std::size_t chunkIndex);

} // namespace notegraph::identity
