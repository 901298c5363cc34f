#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace notegraph::extraction::util {

bool isValidUtf8(std::string_view data);

// Copy of `data` with every malformed byte replaced by U+FFFD, safe to log and serialize
std::string sanitizeUtf8(std::string_view data);

// Runs of whitespace become one space; leading and trailing whitespace is dropped
std::string collapseWhitespace(std::string_view s);

/**
 * Note title: text of a level-one "# " heading when it is the first non-blank line,
 * otherwise the file stem of the path.
 */
std::string extractTitle(std::string_view content, std::string_view canonicalPath);

/**
 * Whitespace-collapsed text around [position, position + length), extended by `width`
 * bytes on both sides and widened to UTF-8 character boundaries.
 */
std::string contextAround(std::string_view content, size_t position, size_t length, size_t width);

/**
 * Weight of the relationship between a note and a target it mentions, in [0, 1].
 * Each case-insensitive occurrence of `target` in `content` adds 0.3 (capped at 1.0),
 * and each markdown heading line that mentions it adds another 0.2.
 */
double relationshipStrength(std::string_view content, std::string_view target);

// MIME type from the file extension; "application/octet-stream" when unknown
std::string mimeTypeForPath(std::string_view path);

} // namespace notegraph::extraction::util
