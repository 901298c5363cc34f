#pragma once

#include <notegraph/config/config_helpers.h>
#include <notegraph/core/types.h>
#include <notegraph/ingest/ingestion_pipeline.h>
#include <notegraph/ml/provider.h>

#include <filesystem>
#include <string>

namespace notegraph::config {

/**
 * Fully resolved settings for ingestion and retrieval.
 *
 * File layout (TOML subset):
 *   [notes]        root, extensions, exclude, exclude_suffixes
 *   [attachments]  search_roots
 *   [patterns]     <kind> or <kind>.<name> = regex (replaces the built-in table)
 *   [chunking]     strategy, chunk_size, chunk_overlap
 *   [embedding]    provider, dimension, batch_size, max_concurrency, max_retries,
 *                  initial_backoff_ms, max_backoff_ms
 *   [ingest]       max_workers, fail_fast, context_chars
 *   [output]       path
 *   [retrieval]    top_k, expand_hops
 *   [logging]      level
 */
struct NotegraphConfig {
    ingest::IngestionConfig ingest;
    std::string providerName = "mock";
    ml::ProviderOptions provider;
    size_t topK = 10;
    size_t expandHops = 1;
    std::string logLevel = "info";
};

// Apply a parsed file on top of `base`; keys absent from the file keep their base value
Result<NotegraphConfig> parseConfig(const ConfigFile& file, NotegraphConfig base = {});

Result<NotegraphConfig> loadConfig(const std::filesystem::path& path);

// get_config_path() lookup; a missing file yields the defaults
Result<NotegraphConfig> loadDefaultConfig(const std::string& overridePath = "");

// trace, debug, info, warn, error, critical or off
Result<void> applyLogLevel(const std::string& level);

} // namespace notegraph::config
