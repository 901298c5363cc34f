#include <notegraph/config/notegraph_config.h>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

namespace notegraph::config {

namespace {

const std::map<std::string, std::set<std::string>> kKnownKeys = {
    {"notes", {"root", "extensions", "exclude", "exclude_suffixes"}},
    {"attachments", {"search_roots"}},
    {"chunking", {"strategy", "chunk_size", "chunk_overlap"}},
    {"embedding",
     {"provider", "dimension", "batch_size", "max_concurrency", "max_retries",
      "initial_backoff_ms", "max_backoff_ms"}},
    {"ingest", {"max_workers", "fail_fast", "context_chars"}},
    {"output", {"path"}},
    {"retrieval", {"top_k", "expand_hops"}},
    {"logging", {"level"}},
};

// Reads an optional size_t key into `target`
Result<void> readSize(const ConfigFile& file, const std::string& section, const std::string& key,
                      size_t& target, bool allowZero = true) {
    auto raw = file.find(section, key);
    if (!raw) {
        return Result<void>();
    }
    auto parsed = parse_size(*raw);
    if (!parsed) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("[{}] {}: {}", section, key, parsed.error().message)};
    }
    if (!allowZero && parsed.value() == 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("[{}] {}: must be greater than zero", section, key)};
    }
    target = parsed.value();
    return Result<void>();
}

Result<void> readMillis(const ConfigFile& file, const std::string& section,
                        const std::string& key, std::chrono::milliseconds& target) {
    size_t value = static_cast<size_t>(target.count());
    auto r = readSize(file, section, key, value);
    if (!r) {
        return r;
    }
    target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(value));
    return Result<void>();
}

std::optional<std::string> rawList(const ConfigFile& file, const std::string& section,
                                   const std::string& key) {
    const auto& entries = file.entries(section);
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->first == key) {
            return it->second;
        }
    }
    return std::nullopt;
}

void warnUnknownKeys(const ConfigFile& file) {
    for (const auto& [section, keys] : kKnownKeys) {
        for (const auto& [key, _] : file.entries(section)) {
            if (keys.count(key) == 0) {
                spdlog::debug("Ignoring unknown config key [{}] {}", section, key);
            }
        }
    }
}

Result<void> readPatterns(const ConfigFile& file, ingest::IngestionConfig& cfg) {
    const auto& entries = file.entries("patterns");
    if (entries.empty()) {
        return Result<void>();
    }

    std::vector<extraction::ReferencePattern> patterns;
    for (const auto& [key, rawValue] : entries) {
        std::string kindName = key;
        std::string name = key;
        if (auto dot = key.find('.'); dot != std::string::npos) {
            kindName = key.substr(0, dot);
            name = key.substr(dot + 1);
        } else if (key.size() > 8 && key.compare(key.size() - 8, 8, "_pattern") == 0) {
            kindName = key.substr(0, key.size() - 8);
            name = kindName;
        }
        auto kind = referenceKindFromString(kindName);
        if (!kind) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("[patterns] {}: unknown reference kind '{}'", key, kindName)};
        }
        patterns.push_back(extraction::ReferencePattern{*kind, name, unquote(rawValue), 1});
    }

    // Validate now so a bad regex is reported as a config error
    auto compiled = extraction::PatternTable::compile(patterns);
    if (!compiled) {
        return Error{ErrorCode::InvalidArgument, "[patterns] " + compiled.error().message};
    }
    cfg.patterns = std::move(patterns);
    return Result<void>();
}

} // namespace

Result<void> applyLogLevel(const std::string& level) {
    static const std::map<std::string, spdlog::level::level_enum> kLevels = {
        {"trace", spdlog::level::trace},   {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},     {"warn", spdlog::level::warn},
        {"warning", spdlog::level::warn},  {"error", spdlog::level::err},
        {"err", spdlog::level::err},       {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    std::string lower = level;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kLevels.find(lower);
    if (it == kLevels.end()) {
        return Error{ErrorCode::InvalidArgument, fmt::format("Unknown log level '{}'", level)};
    }
    spdlog::set_level(it->second);
    return Result<void>();
}

Result<NotegraphConfig> parseConfig(const ConfigFile& file, NotegraphConfig base) {
    NotegraphConfig cfg = std::move(base);
    auto& ing = cfg.ingest;
    warnUnknownKeys(file);

    // [notes]
    if (auto root = file.find("notes", "root")) {
        ing.notesRoot = expand_tilde(*root);
    }
    if (auto raw = rawList(file, "notes", "extensions")) {
        ing.catalog.noteExtensions = parse_string_list(*raw);
    }
    if (auto raw = rawList(file, "notes", "exclude")) {
        ing.catalog.excludePatterns = parse_string_list(*raw);
    }
    if (auto raw = rawList(file, "notes", "exclude_suffixes")) {
        ing.catalog.excludeSuffixes = parse_string_list(*raw);
    }

    // [attachments]
    if (auto raw = rawList(file, "attachments", "search_roots")) {
        ing.attachments.searchRoots = parse_string_list(*raw);
    }

    // [patterns]
    if (auto r = readPatterns(file, ing); !r) {
        return r.error();
    }

    // [chunking]
    if (auto strategy = file.find("chunking", "strategy")) {
        auto parsed = vector::chunkingStrategyFromString(*strategy);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("[chunking] strategy: unknown strategy '{}'", *strategy)};
        }
        ing.chunking.strategy = *parsed;
    }
    for (auto r : {readSize(file, "chunking", "chunk_size", ing.chunking.chunk_size, false),
                   readSize(file, "chunking", "chunk_overlap", ing.chunking.overlap_size)}) {
        if (!r) {
            return r.error();
        }
    }
    if (ing.chunking.overlap_size >= ing.chunking.chunk_size) {
        return Error{ErrorCode::InvalidArgument,
                     "[chunking] chunk_overlap must be smaller than chunk_size"};
    }

    // [embedding]
    if (auto provider = file.find("embedding", "provider")) {
        cfg.providerName = *provider;
    }
    for (auto r : {readSize(file, "embedding", "dimension", cfg.provider.dimension, false),
                   readSize(file, "embedding", "batch_size", ing.embedding.batch_size, false),
                   readSize(file, "embedding", "max_concurrency", ing.embedding.max_concurrency,
                            false),
                   readSize(file, "embedding", "max_retries", ing.embedding.max_retries),
                   readMillis(file, "embedding", "initial_backoff_ms",
                              ing.embedding.initial_backoff),
                   readMillis(file, "embedding", "max_backoff_ms", ing.embedding.max_backoff)}) {
        if (!r) {
            return r.error();
        }
    }

    // [ingest]
    for (auto r : {readSize(file, "ingest", "max_workers", ing.maxWorkers),
                   readSize(file, "ingest", "context_chars", ing.contextChars)}) {
        if (!r) {
            return r.error();
        }
    }
    if (auto raw = file.find("ingest", "fail_fast")) {
        auto parsed = parse_bool(*raw);
        if (!parsed) {
            return Error{ErrorCode::InvalidArgument,
                         "[ingest] fail_fast: " + parsed.error().message};
        }
        ing.failFast = parsed.value();
    }

    // [output]
    if (auto path = file.find("output", "path")) {
        ing.outputPath = expand_tilde(*path);
    }

    // [retrieval]
    for (auto r : {readSize(file, "retrieval", "top_k", cfg.topK),
                   readSize(file, "retrieval", "expand_hops", cfg.expandHops)}) {
        if (!r) {
            return r.error();
        }
    }

    // [logging]
    if (auto level = file.find("logging", "level")) {
        cfg.logLevel = *level;
    }

    return cfg;
}

Result<NotegraphConfig> loadConfig(const std::filesystem::path& path) {
    auto file = parse_config_file(path);
    if (!file) {
        return file.error();
    }
    auto cfg = parseConfig(file.value());
    if (cfg) {
        spdlog::debug("Loaded configuration from {}", path.string());
    }
    return cfg;
}

Result<NotegraphConfig> loadDefaultConfig(const std::string& overridePath) {
    auto path = get_config_path(overridePath);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (!overridePath.empty()) {
            return Error{ErrorCode::FileNotFound,
                         fmt::format("Config file not found: {}", path.string())};
        }
        spdlog::info("No config file at {}, using defaults", path.string());
        return NotegraphConfig{};
    }
    return loadConfig(path);
}

} // namespace notegraph::config
