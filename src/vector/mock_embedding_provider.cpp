#include <notegraph/crypto/hasher.h>
#include <notegraph/ml/provider.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <map>
#include <mutex>
#include <random>

namespace notegraph::ml {

// ============================================================================
// Mock Embedding Provider Implementation
// ============================================================================

namespace {

uint64_t seedFromText(const std::string& text) {
    auto digest = crypto::SHA256Hasher::hashText(text);
    return std::stoull(digest.substr(0, 16), nullptr, 16);
}

class MockEmbeddingProvider : public IEmbeddingProvider {
public:
    explicit MockEmbeddingProvider(size_t dimension) : dimension_(dimension) {
        spdlog::debug("MockEmbeddingProvider created with dimension {}", dimension);
    }

    ~MockEmbeddingProvider() override {
        if (initialized_) {
            shutdown();
        }
    }

    Result<void> initialize() override {
        if (dimension_ == 0) {
            return Error{ErrorCode::InvalidArgument, "Mock provider dimension must be positive"};
        }
        initialized_ = true;
        return Result<void>();
    }

    void shutdown() override { initialized_ = false; }

    Result<std::vector<float>> generateEmbedding(const std::string& text) override {
        if (!initialized_) {
            return Error{ErrorCode::NotInitialized, "Mock provider not initialized"};
        }

        // mt19937_64's output sequence is fixed by the standard, unlike the distributions
        std::mt19937_64 gen(seedFromText(text));
        std::vector<float> embedding(dimension_);
        double norm = 0.0;
        for (size_t i = 0; i < dimension_; ++i) {
            double unit = static_cast<double>(gen() >> 11) * (1.0 / 9007199254740992.0);
            embedding[i] = static_cast<float>(unit * 2.0 - 1.0);
            norm += static_cast<double>(embedding[i]) * embedding[i];
        }

        norm = std::sqrt(norm);
        if (norm > 0) {
            for (float& val : embedding) {
                val = static_cast<float>(val / norm);
            }
        }
        return embedding;
    }

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        std::vector<std::vector<float>> embeddings;
        embeddings.reserve(texts.size());
        for (const auto& text : texts) {
            auto result = generateEmbedding(text);
            if (!result) {
                return result.error();
            }
            embeddings.push_back(std::move(result).value());
        }
        return embeddings;
    }

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "mock"; }
    size_t getEmbeddingDimension() const override { return dimension_; }
    size_t getMaxSequenceLength() const override { return 0; }

private:
    size_t dimension_;
    bool initialized_ = false;
};

// ============================================================================
// Provider Registry
// ============================================================================

struct Registry {
    std::mutex mutex;
    std::map<std::string, EmbeddingProviderFactory> factories;

    Registry() {
        factories["mock"] = [](const ProviderOptions& options) {
            return createMockEmbeddingProvider(options.dimension);
        };
    }

    static Registry& instance() {
        static Registry registry;
        return registry;
    }
};

} // namespace

std::unique_ptr<IEmbeddingProvider> createMockEmbeddingProvider(size_t dimension) {
    return std::make_unique<MockEmbeddingProvider>(dimension);
}

void registerEmbeddingProvider(const std::string& name, EmbeddingProviderFactory factory) {
    auto& registry = Registry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    registry.factories[name] = std::move(factory);
}

std::vector<std::string> getRegisteredEmbeddingProviders() {
    auto& registry = Registry::instance();
    std::lock_guard<std::mutex> lock(registry.mutex);
    std::vector<std::string> names;
    for (const auto& [name, _] : registry.factories) {
        names.push_back(name);
    }
    return names;
}

std::unique_ptr<IEmbeddingProvider> createEmbeddingProvider(const std::string& name,
                                                            const ProviderOptions& options) {
    EmbeddingProviderFactory factory;
    {
        auto& registry = Registry::instance();
        std::lock_guard<std::mutex> lock(registry.mutex);
        auto it = registry.factories.find(name);
        if (it == registry.factories.end()) {
            spdlog::error("Embedding provider '{}' is not registered", name);
            return nullptr;
        }
        factory = it->second;
    }
    return factory(options);
}

} // namespace notegraph::ml
