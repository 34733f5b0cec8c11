// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/ContentHasher.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace sentence_dedup {

namespace {
constexpr size_t kSha256Size = 32;
}

std::string sha256Digest(const void* data, size_t size) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    if (EVP_Digest(data, size, digest, &digest_length, EVP_sha256(), nullptr) != 1 ||
        digest_length != kSha256Size) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_length);
}

Sha256Hasher::Sha256Hasher(size_t digest_size) : digest_size_(digest_size) {
    if (digest_size_ == 0 || digest_size_ > kSha256Size) {
        throw std::invalid_argument("SHA-256 digest size must be between 1 and 32 bytes");
    }
}

std::string Sha256Hasher::name() const {
    if (digest_size_ == kSha256Size) {
        return "sha256";
    }
    if (digest_size_ == 4) {
        return "sha256_trunc32";
    }
    return "sha256_trunc" + std::to_string(digest_size_ * 8);
}

ContentHash Sha256Hasher::hash(const std::string& bytes) const {
    std::string digest = sha256Digest(bytes.data(), bytes.size());
    digest.resize(digest_size_);
    return digest;
}

std::shared_ptr<const ContentHasher> makeContentHasher(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::Sha256Trunc32:
            return std::make_shared<Sha256Hasher>(4);
        case HashAlgorithm::Sha256:
        default:
            return std::make_shared<Sha256Hasher>(kSha256Size);
    }
}

std::string toString(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::Sha256Trunc32 ? "sha256_trunc32" : "sha256";
}

std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& value) {
    if (value == "sha256") {
        return HashAlgorithm::Sha256;
    }
    if (value == "sha256_trunc32") {
        return HashAlgorithm::Sha256Trunc32;
    }
    return std::nullopt;
}

}  // namespace sentence_dedup
