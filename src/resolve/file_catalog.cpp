#include <notegraph/common/pattern_utils.h>
#include <notegraph/extraction/text_utils.h>
#include <notegraph/resolve/file_catalog.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace notegraph::resolve {

namespace {

bool endsWithIgnoreCase(std::string_view text, std::string_view suffix) {
    if (suffix.size() > text.size()) {
        return false;
    }
    auto tail = text.substr(text.size() - suffix.size());
    return std::equal(tail.begin(), tail.end(), suffix.begin(), suffix.end(), [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) ==
               std::tolower(static_cast<unsigned char>(b));
    });
}

} // namespace

Result<FileCatalog> FileCatalog::scan(const std::filesystem::path& root, CatalogOptions options) {
    namespace fs = std::filesystem;

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Error{ErrorCode::FileNotFound, "Notes root is not a directory: " + root.string()};
    }

    FileCatalog catalog;
    catalog.root_ = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        catalog.root_ = root;
    }
    catalog.options_ = std::move(options);

    fs::recursive_directory_iterator it(catalog.root_, fs::directory_options::skip_permission_denied,
                                        ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Failed to enumerate notes root " + root.string() + ": " + ec.message()};
    }

    size_t skipped = 0;
    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Error{ErrorCode::InternalError,
                         "Failed while enumerating notes root: " + ec.message()};
        }
        auto relative = it->path().lexically_relative(catalog.root_).generic_string();

        if (it->is_directory(ec)) {
            // Prune excluded trees early
            if (catalog.excluded(relative + "/")) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        if (catalog.excluded(relative)) {
            ++skipped;
            continue;
        }
        catalog.add(std::move(relative));
    }

    catalog.finalize();
    spdlog::debug("File catalog for {}: {} files, {} notes, {} excluded", catalog.root_.string(),
                  catalog.files_.size(), catalog.notes_.size(), skipped);
    for (const auto& path : catalog.rejected_) {
        spdlog::warn("Ignoring file with a non UTF-8 path: {}",
                     extraction::util::sanitizeUtf8(path));
    }
    return catalog;
}

FileCatalog FileCatalog::fromPaths(std::filesystem::path root, std::vector<std::string> paths,
                                   CatalogOptions options) {
    FileCatalog catalog;
    catalog.root_ = std::move(root);
    catalog.options_ = std::move(options);
    for (auto& p : paths) {
        if (!catalog.excluded(p)) {
            catalog.add(std::move(p));
        }
    }
    catalog.finalize();
    return catalog;
}

void FileCatalog::add(std::string relativePath) {
    if (extraction::util::isValidUtf8(relativePath)) {
        files_.push_back(std::move(relativePath));
    } else {
        rejected_.push_back(std::move(relativePath));
    }
}

void FileCatalog::finalize() {
    std::sort(rejected_.begin(), rejected_.end());
    std::sort(files_.begin(), files_.end());
    files_.erase(std::unique(files_.begin(), files_.end()), files_.end());
    notes_.clear();
    for (const auto& f : files_) {
        if (isNote(f)) {
            notes_.push_back(f);
        }
    }
}

bool FileCatalog::excluded(std::string_view relativePath) const {
    return common::matches_any(relativePath, options_.excludePatterns);
}

bool FileCatalog::contains(std::string_view relativePath) const {
    return std::binary_search(files_.begin(), files_.end(), relativePath,
                              [](std::string_view a, std::string_view b) { return a < b; });
}

bool FileCatalog::hasNoteExtension(std::string_view relativePath) const {
    return std::any_of(options_.noteExtensions.begin(), options_.noteExtensions.end(),
                       [&](const std::string& ext) { return endsWithIgnoreCase(relativePath, ext); });
}

bool FileCatalog::isNote(std::string_view relativePath) const {
    if (!hasNoteExtension(relativePath)) {
        return false;
    }
    return std::none_of(options_.excludeSuffixes.begin(), options_.excludeSuffixes.end(),
                        [&](const std::string& s) { return endsWithIgnoreCase(relativePath, s); });
}

std::filesystem::path FileCatalog::absolutePath(std::string_view relativePath) const {
    return root_ / std::filesystem::path(std::string(relativePath));
}

std::vector<std::string> FileCatalog::findBySuffix(std::string_view target,
                                                   std::string_view directory,
                                                   bool notesOnly) const {
    std::vector<std::string> out;
    if (target.empty()) {
        return out;
    }

    std::string prefix;
    if (!directory.empty()) {
        prefix = std::string(directory);
        if (prefix.back() != '/') {
            prefix.push_back('/');
        }
    }

    const auto& pool = notesOnly ? notes_ : files_;
    auto it = std::lower_bound(pool.begin(), pool.end(), prefix);
    for (; it != pool.end(); ++it) {
        std::string_view path = *it;
        if (!prefix.empty() && path.substr(0, prefix.size()) != prefix) {
            break;
        }
        if (common::ends_with_segment(path.substr(prefix.size()), target)) {
            out.push_back(*it);
        }
    }
    return out;
}

} // namespace notegraph::resolve
