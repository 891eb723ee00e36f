#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace payplan::crypto {

// Interface for streaming digests
class IDigestHasher {
public:
    virtual ~IDigestHasher() = default;

    virtual void init() = 0;
    virtual void update(std::span<const std::byte> data) = 0;
    virtual std::string finalize() = 0;

    // Feed a string field; fields are length-prefixed so "ab"+"c" != "a"+"bc"
    void updateField(std::string_view field) {
        const std::string prefix = std::to_string(field.size()) + ":";
        update(std::as_bytes(std::span{prefix.data(), prefix.size()}));
        update(std::as_bytes(std::span{field.data(), field.size()}));
    }
};

// SHA-256 implementation (OpenSSL EVP)
class SHA256Hasher : public IDigestHasher {
public:
    SHA256Hasher();
    ~SHA256Hasher();

    // Disable copy, enable move
    SHA256Hasher(const SHA256Hasher&) = delete;
    SHA256Hasher& operator=(const SHA256Hasher&) = delete;
    SHA256Hasher(SHA256Hasher&&) noexcept;
    SHA256Hasher& operator=(SHA256Hasher&&) noexcept;

    void init() override;
    void update(std::span<const std::byte> data) override;
    std::string finalize() override;

    // Static utility for one-shot hashing, lowercase hex
    static std::string hash(std::string_view data);

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

// Factory function
std::unique_ptr<IDigestHasher> createSHA256Hasher();

} // namespace payplan::crypto
