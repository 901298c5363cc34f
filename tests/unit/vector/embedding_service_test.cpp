#include <gtest/gtest.h>
#include <notegraph/ml/provider.h>
#include <notegraph/vector/embedding_service.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <set>
#include <string>
#include <vector>

using namespace notegraph;
using namespace notegraph::vector;
using namespace std::chrono_literals;

namespace {

/**
 * Provider whose failures are scripted: the first `failBatchCalls` batch calls fail, and
 * any text listed in `poisoned` always fails, alone or inside a batch.
 */
class ScriptedProvider : public ml::IEmbeddingProvider {
public:
    explicit ScriptedProvider(size_t dim = 4) : dim_(dim) {}

    Result<std::vector<float>> generateEmbedding(const std::string& text) override {
        singleCalls.fetch_add(1);
        if (poisoned.count(text)) {
            return Error{ErrorCode::EmbeddingFailed, "poisoned text"};
        }
        if (throwOnSingle) {
            throw std::runtime_error("provider crashed");
        }
        return vectorFor(text);
    }

    Result<std::vector<std::vector<float>>>
    generateBatchEmbeddings(const std::vector<std::string>& texts) override {
        auto n = batchCalls.fetch_add(1);
        if (n < failBatchCalls) {
            return Error{ErrorCode::Timeout, "transient batch failure"};
        }
        std::vector<std::vector<float>> out;
        for (const auto& t : texts) {
            if (poisoned.count(t)) {
                return Error{ErrorCode::EmbeddingFailed, "batch contains poisoned text"};
            }
            out.push_back(vectorFor(t));
        }
        if (shortBatch && !out.empty()) {
            out.pop_back();
        }
        return out;
    }

    bool isAvailable() const override { return true; }
    std::string getProviderName() const override { return "scripted"; }
    size_t getEmbeddingDimension() const override { return dim_; }
    size_t getMaxSequenceLength() const override { return 0; }
    Result<void> initialize() override { return Result<void>(); }
    void shutdown() override {}

    std::vector<float> vectorFor(const std::string& text) const {
        std::vector<float> v(dim_, 0.0f);
        v[text.size() % dim_] = 1.0f;
        return v;
    }

    std::set<std::string> poisoned;
    size_t failBatchCalls = 0;
    bool shortBatch = false;
    bool throwOnSingle = false;
    std::atomic<size_t> batchCalls{0};
    std::atomic<size_t> singleCalls{0};

private:
    size_t dim_;
};

} // namespace

class EmbeddingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<ScriptedProvider>();
        config_.batch_size = 2;
        config_.max_concurrency = 1;
        config_.max_retries = 2;
        config_.initial_backoff = 100ms;
        config_.max_backoff = 150ms;
    }

    std::unique_ptr<EmbeddingService> makeService() {
        auto service = std::make_unique<EmbeddingService>(provider_, config_);
        service->setSleeper([this](std::chrono::milliseconds d) {
            std::lock_guard<std::mutex> lock(sleepMutex_);
            sleeps_.push_back(d);
        });
        return service;
    }

    std::shared_ptr<ScriptedProvider> provider_;
    EmbeddingServiceConfig config_;
    std::mutex sleepMutex_;
    std::vector<std::chrono::milliseconds> sleeps_;
};

TEST_F(EmbeddingServiceTest, EmbedsAllTextsInOrder) {
    auto service = makeService();
    std::vector<std::string> texts = {"a", "bb", "ccc", "dddd", "eeeee"};
    auto out = service->embedAll(texts);

    ASSERT_EQ(out.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        EXPECT_TRUE(out[i].ok);
        EXPECT_EQ(out[i].vector, provider_->vectorFor(texts[i]));
    }
    auto stats = service->getStats();
    EXPECT_EQ(stats.batches, 3u);
    EXPECT_EQ(stats.embedded, 5u);
    EXPECT_EQ(stats.retries, 0u);
    EXPECT_TRUE(sleeps_.empty());
}

TEST_F(EmbeddingServiceTest, TransientBatchFailureIsRetriedWithBackoff) {
    provider_->failBatchCalls = 2;
    auto service = makeService();
    auto out = service->embedAll({"a", "bb"});

    ASSERT_EQ(out.size(), 2u);
    EXPECT_TRUE(out[0].ok);
    EXPECT_TRUE(out[1].ok);
    EXPECT_EQ(provider_->batchCalls.load(), 3u);
    EXPECT_EQ(provider_->singleCalls.load(), 0u);
    ASSERT_EQ(sleeps_.size(), 2u);
    EXPECT_EQ(sleeps_[0], 100ms);
    EXPECT_EQ(sleeps_[1], 150ms); // Doubled, then capped
    EXPECT_EQ(service->getStats().retries, 2u);
}

TEST_F(EmbeddingServiceTest, BackoffDoublesUpToCap) {
    config_.initial_backoff = 10ms;
    config_.max_backoff = 45ms;
    EmbeddingService service(provider_, config_);
    EXPECT_EQ(service.backoffFor(1), 10ms);
    EXPECT_EQ(service.backoffFor(2), 20ms);
    EXPECT_EQ(service.backoffFor(3), 40ms);
    EXPECT_EQ(service.backoffFor(4), 45ms);
    EXPECT_EQ(service.backoffFor(10), 45ms);
}

TEST_F(EmbeddingServiceTest, PoisonedTextFailsAloneAfterFallback) {
    provider_->poisoned = {"bad"};
    auto service = makeService();
    auto out = service->embedAll({"good", "bad", "fine"});

    ASSERT_EQ(out.size(), 3u);
    EXPECT_TRUE(out[0].ok);
    EXPECT_FALSE(out[1].ok);
    EXPECT_FALSE(out[1].error.empty());
    EXPECT_TRUE(out[1].vector.empty());
    EXPECT_TRUE(out[2].ok);

    auto stats = service->getStats();
    EXPECT_EQ(stats.fallbacks, 1u);
    EXPECT_EQ(stats.embedded, 2u);
    EXPECT_EQ(stats.failed, 1u);
}

TEST_F(EmbeddingServiceTest, ShortBatchResultFallsBackPerText) {
    provider_->shortBatch = true;
    auto service = makeService();
    auto out = service->embedAll({"a", "bb"});
    EXPECT_TRUE(out[0].ok);
    EXPECT_TRUE(out[1].ok);
    EXPECT_EQ(service->getStats().fallbacks, 1u);
}

TEST_F(EmbeddingServiceTest, ProviderExceptionsBecomeFailures) {
    provider_->poisoned = {"x"};
    provider_->throwOnSingle = true;
    auto service = makeService();
    auto out = service->embedAll({"x", "y"});
    EXPECT_FALSE(out[0].ok);
    EXPECT_FALSE(out[1].ok);
    EXPECT_EQ(out[1].error, "provider crashed");
}

TEST_F(EmbeddingServiceTest, WrongDimensionIsRejected) {
    class WrongDim : public ScriptedProvider {
    public:
        size_t getEmbeddingDimension() const override { return 8; }
    };
    auto provider = std::make_shared<WrongDim>();
    EmbeddingService service(provider, config_);
    service.setSleeper([](std::chrono::milliseconds) {});
    auto out = service.embedAll({"a"});
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].ok);
    EXPECT_NE(out[0].error.find("dimension"), std::string::npos);
}

TEST_F(EmbeddingServiceTest, ConcurrentBatchesKeepOrder) {
    config_.max_concurrency = 4;
    auto service = makeService();
    std::vector<std::string> texts;
    for (int i = 0; i < 37; ++i) {
        texts.push_back(std::string(static_cast<size_t>(i + 1), 'x'));
    }
    auto out = service->embedAll(texts);
    ASSERT_EQ(out.size(), texts.size());
    for (size_t i = 0; i < texts.size(); ++i) {
        ASSERT_TRUE(out[i].ok);
        EXPECT_EQ(out[i].vector, provider_->vectorFor(texts[i]));
    }
}

TEST(MockEmbeddingProviderTest, DeterministicUnitVectors) {
    auto a = ml::createMockEmbeddingProvider(16);
    auto b = ml::createEmbeddingProvider("mock", ml::ProviderOptions{16});
    ASSERT_TRUE(b);
    ASSERT_TRUE(a->initialize());
    ASSERT_TRUE(b->initialize());

    auto va = a->generateEmbedding("hello world");
    auto vb = b->generateEmbedding("hello world");
    ASSERT_TRUE(va);
    ASSERT_TRUE(vb);
    EXPECT_EQ(va.value(), vb.value());
    ASSERT_EQ(va.value().size(), 16u);

    double norm = 0.0;
    for (float x : va.value()) {
        norm += static_cast<double>(x) * x;
    }
    EXPECT_NEAR(norm, 1.0, 1e-5);

    auto other = a->generateEmbedding("something else");
    ASSERT_TRUE(other);
    EXPECT_NE(other.value(), va.value());
}

TEST(MockEmbeddingProviderTest, RequiresInitialization) {
    auto p = ml::createMockEmbeddingProvider(8);
    EXPECT_FALSE(p->generateEmbedding("x"));
    EXPECT_FALSE(ml::createMockEmbeddingProvider(0)->initialize());
}

TEST(EmbeddingProviderRegistryTest, UnknownNameReturnsNull) {
    EXPECT_FALSE(ml::createEmbeddingProvider("no-such-provider"));
}

TEST(EmbeddingProviderRegistryTest, RegisteredFactoryIsUsed) {
    ml::registerEmbeddingProvider("scripted-test", [](const ml::ProviderOptions& opts) {
        return std::make_unique<ScriptedProvider>(opts.dimension);
    });
    auto names = ml::getRegisteredEmbeddingProviders();
    EXPECT_NE(std::find(names.begin(), names.end(), "mock"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "scripted-test"), names.end());

    auto p = ml::createEmbeddingProvider("scripted-test", ml::ProviderOptions{6});
    ASSERT_TRUE(p);
    EXPECT_EQ(p->getProviderName(), "scripted");
    EXPECT_EQ(p->getEmbeddingDimension(), 6u);
}
