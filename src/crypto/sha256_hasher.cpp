#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <array>
#include <stdexcept>
#include <payplan/crypto/hasher.h>

namespace payplan::crypto {

struct SHA256Hasher::Impl {
    EVP_MD_CTX* ctx = nullptr;

    Impl() : ctx(EVP_MD_CTX_new()) {
        if (!ctx) {
            throw std::runtime_error("Failed to create EVP_MD_CTX");
        }
    }

    ~Impl() {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;
};

SHA256Hasher::SHA256Hasher() : pImpl(std::make_unique<Impl>()) {
    init();
}

SHA256Hasher::~SHA256Hasher() = default;

SHA256Hasher::SHA256Hasher(SHA256Hasher&&) noexcept = default;
SHA256Hasher& SHA256Hasher::operator=(SHA256Hasher&&) noexcept = default;

void SHA256Hasher::init() {
    if (EVP_DigestInit_ex(pImpl->ctx, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
}

void SHA256Hasher::update(std::span<const std::byte> data) {
    if (EVP_DigestUpdate(pImpl->ctx, data.data(), data.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }
}

std::string SHA256Hasher::finalize() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hashLen = 0;

    if (EVP_DigestFinal_ex(pImpl->ctx, hash.data(), &hashLen) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }

    std::string result;
    result.reserve(hashLen * 2);
    for (unsigned int i = 0; i < hashLen; ++i) {
        result += fmt::format("{:02x}", hash[i]);
    }

    // Reset for potential reuse
    init();

    return result;
}

std::string SHA256Hasher::hash(std::string_view data) {
    SHA256Hasher hasher;
    hasher.update(std::as_bytes(std::span{data.data(), data.size()}));
    return hasher.finalize();
}

std::unique_ptr<IDigestHasher> createSHA256Hasher() {
    return std::make_unique<SHA256Hasher>();
}

} // namespace payplan::crypto
