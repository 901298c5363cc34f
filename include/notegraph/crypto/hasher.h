#pragma once

#include <notegraph/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace notegraph::crypto {

// Interface for content hashers
class IContentHasher {
public:
    virtual ~IContentHasher() = default;

    // Stream-based hashing
    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Hash a whole file; error when the file cannot be read
    virtual Result<std::string> hashFile(const std::filesystem::path& path) = 0;

    std::string hash(std::string_view text) {
        init();
        update(std::as_bytes(std::span<const char>(text.data(), text.size())));
        return finalize();
    }
};

// SHA-256 implementation backed by OpenSSL EVP
class SHA256Hasher : public IContentHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    Result<std::string> hashFile(const std::filesystem::path& path) override;

    // One-shot hashing, lowercase hex
    static std::string hashText(std::string_view text);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

std::unique_ptr<IContentHasher> createSHA256Hasher();

} // namespace notegraph::crypto
