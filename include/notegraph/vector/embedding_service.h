#pragma once

#include <notegraph/core/types.h>
#include <notegraph/ml/provider.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace notegraph::vector {

struct EmbeddingServiceConfig {
    size_t batch_size = 16;
    size_t max_concurrency = 4; // Batches in flight
    size_t max_retries = 3;     // Attempts after the first one
    std::chrono::milliseconds initial_backoff{100};
    std::chrono::milliseconds max_backoff{2000};
};

struct EmbeddingOutcome {
    std::vector<float> vector;
    bool ok = false;
    std::string error; // Set when !ok
};

struct EmbeddingServiceStats {
    uint64_t batches = 0;
    uint64_t retries = 0;
    uint64_t fallbacks = 0; // Batches degraded to per-text calls
    uint64_t embedded = 0;
    uint64_t failed = 0;
};

/**
 * Embeds texts through an IEmbeddingProvider in fixed-size batches on a bounded pool.
 *
 * A failed batch is retried with exponential backoff, then each of its texts is embedded
 * on its own under the same retry policy. Texts that still fail come back with ok=false;
 * one failure never affects the outcome of another text.
 */
class EmbeddingService {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    EmbeddingService(std::shared_ptr<ml::IEmbeddingProvider> provider,
                     EmbeddingServiceConfig config = {});

    // One outcome per text, in input order
    std::vector<EmbeddingOutcome> embedAll(const std::vector<std::string>& texts);

    EmbeddingServiceStats getStats() const;

    // Replace the backoff sleep (tests)
    void setSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

    std::chrono::milliseconds backoffFor(size_t attempt) const;

private:
    void embedBatch(const std::vector<std::string>& texts, size_t begin, size_t end,
                    std::vector<EmbeddingOutcome>& out);
    Result<std::vector<std::vector<float>>> batchWithRetry(const std::vector<std::string>& batch);
    Result<std::vector<float>> singleWithRetry(const std::string& text);
    Result<void> checkVector(const std::vector<float>& v) const;

    std::shared_ptr<ml::IEmbeddingProvider> provider_;
    EmbeddingServiceConfig config_;
    Sleeper sleeper_;

    std::atomic<uint64_t> batches_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> fallbacks_{0};
    std::atomic<uint64_t> embedded_{0};
    std::atomic<uint64_t> failed_{0};
};

} // namespace notegraph::vector
