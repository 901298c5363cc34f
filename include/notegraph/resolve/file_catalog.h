#pragma once

#include <notegraph/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace notegraph::resolve {

struct CatalogOptions {
    // Wildcards over the root-relative generic path
    std::vector<std::string> excludePatterns = {".obsidian/*", ".git/*", ".trash/*"};
    std::vector<std::string> noteExtensions = {".md"};
    // Files with a note extension that are not notes (drawings stored as markdown)
    std::vector<std::string> excludeSuffixes = {".excalidraw.md"};
};

/**
 * Sorted snapshot of every regular file under the notes root, taken once per run.
 * Paths are generic ("/"-separated) and relative to the root, so lookups never depend
 * on directory enumeration order.
 */
class FileCatalog {
public:
    FileCatalog() = default;

    static Result<FileCatalog> scan(const std::filesystem::path& root, CatalogOptions options = {});

    // Build a catalog from known relative paths without touching the filesystem
    static FileCatalog fromPaths(std::filesystem::path root, std::vector<std::string> paths,
                                 CatalogOptions options = {});

    const std::filesystem::path& root() const { return root_; }
    const CatalogOptions& options() const { return options_; }

    const std::vector<std::string>& files() const { return files_; }
    const std::vector<std::string>& notes() const { return notes_; }
    // Files left out because their relative path is not valid UTF-8, sorted
    const std::vector<std::string>& rejected() const { return rejected_; }

    bool contains(std::string_view relativePath) const;
    bool isNote(std::string_view relativePath) const;
    bool hasNoteExtension(std::string_view relativePath) const;

    std::filesystem::path absolutePath(std::string_view relativePath) const;

    /**
     * Files below `directory` (empty = whole root) whose path relative to that directory
     * equals `target` or ends with "/" + target. Returned root-relative and sorted.
     * With notesOnly, only note files are considered.
     */
    std::vector<std::string> findBySuffix(std::string_view target, std::string_view directory = {},
                                          bool notesOnly = false) const;

private:
    bool excluded(std::string_view relativePath) const;
    void add(std::string relativePath);
    void finalize();

    std::filesystem::path root_;
    CatalogOptions options_;
    std::vector<std::string> files_;
    std::vector<std::string> notes_;
    std::vector<std::string> rejected_;
};

} // namespace notegraph::resolve
