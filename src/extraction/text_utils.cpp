#include <notegraph/extraction/text_utils.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <unordered_map>

namespace notegraph::extraction::util {

namespace {

const std::unordered_map<std::string, std::string> EXTENSION_MIME_MAP = {
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".svg", "image/svg+xml"},
    {".webp", "image/webp"},
    {".bmp", "image/bmp"},
    {".tif", "image/tiff"},
    {".tiff", "image/tiff"},
    {".pdf", "application/pdf"},
    {".md", "text/markdown"},
    {".txt", "text/plain"},
    {".json", "application/json"},
    {".excalidraw", "application/vnd.excalidraw+json"},
};

bool isContinuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::string trimCopy(std::string_view input) {
    size_t start = 0;
    size_t end = input.size();
    while (start < end && std::isspace(static_cast<unsigned char>(input[start]))) {
        ++start;
    }
    while (end > start && std::isspace(static_cast<unsigned char>(input[end - 1]))) {
        --end;
    }
    return std::string(input.substr(start, end - start));
}

constexpr double kMentionWeight = 0.3;
constexpr double kHeadingWeight = 0.2;

std::string lowerAscii(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

size_t countOccurrences(std::string_view haystack, std::string_view needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string_view::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

// "#" to "######" followed by a space or the end of the line
bool isHeadingLine(std::string_view line) {
    size_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#') {
        ++hashes;
    }
    return hashes >= 1 && hashes <= 6 && (hashes == line.size() || line[hashes] == ' ');
}

// Length of the well-formed sequence starting at data[i], or 0 when it is malformed
size_t utf8SequenceLength(std::string_view data, size_t i) {
    auto byte = static_cast<uint8_t>(data[i]);
    size_t extra = 0;
    uint32_t cp = 0;
    if (byte <= 0x7F) {
        return 1;
    } else if ((byte & 0xE0) == 0xC0) {
        extra = 1;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        extra = 2;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        extra = 3;
        cp = byte & 0x07;
    } else {
        return 0;
    }
    if (i + extra >= data.size()) {
        return 0;
    }
    for (size_t k = 1; k <= extra; ++k) {
        if (!isContinuation(data[i + k])) {
            return 0;
        }
        cp = (cp << 6) | (static_cast<uint8_t>(data[i + k]) & 0x3F);
    }
    // Overlong forms, surrogates and out-of-range code points
    if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) ||
        (extra == 3 && cp < 0x10000) || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return 0;
    }
    return extra + 1;
}

} // namespace

bool isValidUtf8(std::string_view data) {
    for (size_t i = 0; i < data.size();) {
        auto n = utf8SequenceLength(data, i);
        if (n == 0) {
            return false;
        }
        i += n;
    }
    return true;
}

std::string sanitizeUtf8(std::string_view data) {
    static constexpr std::string_view kReplacement = "\xEF\xBF\xBD"; // U+FFFD
    std::string out;
    out.reserve(data.size());
    for (size_t i = 0; i < data.size();) {
        auto n = utf8SequenceLength(data, i);
        if (n == 0) {
            out.append(kReplacement);
            ++i;
            continue;
        }
        out.append(data.substr(i, n));
        i += n;
    }
    return out;
}

std::string collapseWhitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool inSpace = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!inSpace && !out.empty()) {
                out.push_back(' ');
            }
            inSpace = true;
        } else {
            out.push_back(static_cast<char>(c));
            inSpace = false;
        }
    }
    if (!out.empty() && out.back() == ' ') {
        out.pop_back();
    }
    return out;
}

std::string extractTitle(std::string_view content, std::string_view canonicalPath) {
    size_t lineStart = 0;
    while (lineStart < content.size()) {
        size_t lineEnd = content.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = content.size();
        }
        auto line = trimCopy(content.substr(lineStart, lineEnd - lineStart));
        if (!line.empty()) {
            if (line.rfind("# ", 0) == 0) {
                auto title = trimCopy(std::string_view(line).substr(2));
                if (!title.empty()) {
                    return title;
                }
            }
            break;
        }
        lineStart = lineEnd + 1;
    }
    return std::filesystem::path(std::string(canonicalPath)).stem().string();
}

std::string contextAround(std::string_view content, size_t position, size_t length,
                          size_t width) {
    if (position > content.size()) {
        return {};
    }
    size_t start = position > width ? position - width : 0;
    size_t end = std::min(content.size(), position + length + width);
    while (start > 0 && isContinuation(content[start])) {
        --start;
    }
    while (end < content.size() && isContinuation(content[end])) {
        ++end;
    }
    return collapseWhitespace(content.substr(start, end - start));
}

double relationshipStrength(std::string_view content, std::string_view target) {
    if (target.empty()) {
        return 0.0;
    }
    const auto text = lowerAscii(content);
    const auto needle = lowerAscii(target);

    double strength = std::min(kMentionWeight * static_cast<double>(countOccurrences(text, needle)),
                               1.0);
    std::string_view view(text);
    size_t lineStart = 0;
    while (lineStart < view.size()) {
        size_t lineEnd = view.find('\n', lineStart);
        if (lineEnd == std::string_view::npos) {
            lineEnd = view.size();
        }
        auto line = view.substr(lineStart, lineEnd - lineStart);
        if (isHeadingLine(line) && line.find(needle) != std::string_view::npos) {
            strength += kHeadingWeight;
        }
        lineStart = lineEnd + 1;
    }
    return std::min(strength, 1.0);
}

std::string mimeTypeForPath(std::string_view path) {
    std::string ext = std::filesystem::path(std::string(path)).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = EXTENSION_MIME_MAP.find(ext);
    return it != EXTENSION_MIME_MAP.end() ? it->second : "application/octet-stream";
}

} // namespace notegraph::extraction::util
