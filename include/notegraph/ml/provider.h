#pragma once

#include <notegraph/core/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace notegraph::ml {

/**
 * Abstract interface for embedding providers. The engine treats the model as an opaque
 * text -> vector function; implementations may be called from several threads at once.
 */
class IEmbeddingProvider {
public:
    virtual ~IEmbeddingProvider() = default;

    virtual Result<std::vector<float>> generateEmbedding(const std::string& text) = 0;

    // One vector per input text, in input order. A short result counts as a failure.
    virtual Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) = 0;

    virtual bool isAvailable() const = 0;

    // Recorded in the artifact next to the vectors
    virtual std::string getProviderName() const = 0;
    virtual size_t getEmbeddingDimension() const = 0;
    virtual size_t getMaxSequenceLength() const = 0; // 0 = unlimited

    virtual Result<void> initialize() = 0;
    virtual void shutdown() = 0;
};

struct ProviderOptions {
    size_t dimension = 384;
};

using EmbeddingProviderFactory =
    std::function<std::unique_ptr<IEmbeddingProvider>(const ProviderOptions&)>;

/**
 * Create a registered embedding provider by name. The built-in "mock" provider is
 * always registered.
 * @return Provider (not yet initialized) or nullptr when the name is unknown
 */
std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            const ProviderOptions& options = {});

/**
 * Register an embedding provider factory, replacing any factory of the same name
 */
void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory);

// Sorted
std::vector<std::string> getRegisteredEmbeddingProviders();

/**
 * Deterministic provider: vectors are derived from a SHA-256 of the text, so the same
 * text yields the same unit vector in every process.
 */
std::unique_ptr<IEmbeddingProvider> createMockEmbeddingProvider(size_t dimension = 384);

} // namespace notegraph::ml
