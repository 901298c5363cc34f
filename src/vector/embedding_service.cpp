#include <notegraph/vector/embedding_service.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace notegraph::vector {

EmbeddingService::EmbeddingService(std::shared_ptr<ml::IEmbeddingProvider> provider,
                                   EmbeddingServiceConfig config)
    : provider_(std::move(provider)), config_(config),
      sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    config_.batch_size = std::max<size_t>(config_.batch_size, 1);
    config_.max_concurrency = std::max<size_t>(config_.max_concurrency, 1);
}

std::chrono::milliseconds EmbeddingService::backoffFor(size_t attempt) const {
    // attempt 1 waits initial_backoff, each further attempt doubles, capped at max_backoff
    auto delay = config_.initial_backoff;
    for (size_t i = 1; i < attempt && delay < config_.max_backoff; ++i) {
        delay *= 2;
    }
    return std::min(delay, config_.max_backoff);
}

Result<void> EmbeddingService::checkVector(const std::vector<float>& v) const {
    const size_t expected = provider_->getEmbeddingDimension();
    if (v.empty() || (expected != 0 && v.size() != expected)) {
        return Error{ErrorCode::EmbeddingFailed,
                     "Provider returned a vector of dimension " + std::to_string(v.size()) +
                         ", expected " + std::to_string(expected)};
    }
    return Result<void>();
}

Result<std::vector<std::vector<float>>>
EmbeddingService::batchWithRetry(const std::vector<std::string>& batch) {
    Error last{ErrorCode::EmbeddingFailed, "no attempt made"};
    for (size_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            retries_.fetch_add(1, std::memory_order_relaxed);
            sleeper_(backoffFor(attempt));
        }
        try {
            auto result = provider_->generateBatchEmbeddings(batch);
            if (!result) {
                last = result.error();
            } else if (result.value().size() != batch.size()) {
                last = Error{ErrorCode::EmbeddingFailed,
                             "Provider returned " + std::to_string(result.value().size()) +
                                 " vectors for " + std::to_string(batch.size()) + " texts"};
            } else {
                return result;
            }
        } catch (const std::exception& e) {
            last = Error{ErrorCode::EmbeddingFailed, e.what()};
        }
        spdlog::debug("Embedding batch of {} failed (attempt {}/{}): {}", batch.size(),
                      attempt + 1, config_.max_retries + 1, last.message);
    }
    return last;
}

Result<std::vector<float>> EmbeddingService::singleWithRetry(const std::string& text) {
    Error last{ErrorCode::EmbeddingFailed, "no attempt made"};
    for (size_t attempt = 0; attempt <= config_.max_retries; ++attempt) {
        if (attempt > 0) {
            retries_.fetch_add(1, std::memory_order_relaxed);
            sleeper_(backoffFor(attempt));
        }
        try {
            auto result = provider_->generateEmbedding(text);
            if (!result) {
                last = result.error();
                continue;
            }
            if (auto valid = checkVector(result.value()); !valid) {
                // A malformed vector is not transient
                return valid.error();
            }
            return result;
        } catch (const std::exception& e) {
            last = Error{ErrorCode::EmbeddingFailed, e.what()};
        }
    }
    return last;
}

void EmbeddingService::embedBatch(const std::vector<std::string>& texts, size_t begin, size_t end,
                                  std::vector<EmbeddingOutcome>& out) {
    batches_.fetch_add(1, std::memory_order_relaxed);
    std::vector<std::string> batch(texts.begin() + begin, texts.begin() + end);

    auto result = batchWithRetry(batch);
    if (result) {
        auto& vectors = result.value();
        for (size_t i = 0; i < vectors.size(); ++i) {
            auto& slot = out[begin + i];
            if (auto valid = checkVector(vectors[i]); !valid) {
                slot.ok = false;
                slot.error = valid.error().message;
                failed_.fetch_add(1, std::memory_order_relaxed);
                continue;
            }
            slot.vector = std::move(vectors[i]);
            slot.ok = true;
            embedded_.fetch_add(1, std::memory_order_relaxed);
        }
        return;
    }

    spdlog::warn("Embedding batch [{}, {}) failed after {} attempt(s), retrying per chunk: {}",
                 begin, end, config_.max_retries + 1, result.error().message);
    fallbacks_.fetch_add(1, std::memory_order_relaxed);
    for (size_t i = begin; i < end; ++i) {
        auto single = singleWithRetry(texts[i]);
        if (single) {
            out[i].vector = std::move(single).value();
            out[i].ok = true;
            embedded_.fetch_add(1, std::memory_order_relaxed);
        } else {
            out[i].ok = false;
            out[i].error = single.error().message;
            failed_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

std::vector<EmbeddingOutcome> EmbeddingService::embedAll(const std::vector<std::string>& texts) {
    std::vector<EmbeddingOutcome> out(texts.size());
    if (texts.empty()) {
        return out;
    }
    if (!provider_) {
        for (auto& o : out) {
            o.error = "No embedding provider";
        }
        failed_.fetch_add(texts.size(), std::memory_order_relaxed);
        return out;
    }

    const size_t batchCount = (texts.size() + config_.batch_size - 1) / config_.batch_size;
    const size_t threads = std::min(config_.max_concurrency, batchCount);
    spdlog::debug("Embedding {} texts in {} batch(es) on {} thread(s)", texts.size(), batchCount,
                  threads);

    boost::asio::thread_pool pool(threads);
    for (size_t begin = 0; begin < texts.size(); begin += config_.batch_size) {
        size_t end = std::min(begin + config_.batch_size, texts.size());
        // Each task writes only its own slice of `out`
        boost::asio::post(pool, [this, &texts, &out, begin, end]() {
            embedBatch(texts, begin, end, out);
        });
    }
    pool.join();
    return out;
}

EmbeddingServiceStats EmbeddingService::getStats() const {
    EmbeddingServiceStats stats;
    stats.batches = batches_.load();
    stats.retries = retries_.load();
    stats.fallbacks = fallbacks_.load();
    stats.embedded = embedded_.load();
    stats.failed = failed_.load();
    return stats;
}

} // namespace notegraph::vector
