// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_CONTENT_HASHER_HPP
#define SENTENCE_DEDUP_CORE_CONTENT_HASHER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup {

enum class HashAlgorithm {
    Sha256,
    Sha256Trunc32,
};

// Fixed-width content hash. Equal hashes never certify equal content; the
// dictionary always compares raw bytes before reusing an id.
class ContentHasher {
public:
    virtual ~ContentHasher() = default;

    // Persisted with the dictionary; reopening with another name is refused.
    virtual std::string name() const = 0;
    virtual size_t digestSize() const = 0;
    virtual ContentHash hash(const std::string& bytes) const = 0;
};

// SHA-256 through OpenSSL, optionally truncated to the leading bytes.
class Sha256Hasher : public ContentHasher {
public:
    explicit Sha256Hasher(size_t digest_size = 32);

    std::string name() const override;
    size_t digestSize() const override { return digest_size_; }
    ContentHash hash(const std::string& bytes) const override;

private:
    size_t digest_size_;
};

std::shared_ptr<const ContentHasher> makeContentHasher(HashAlgorithm algorithm);

std::string toString(HashAlgorithm algorithm);
std::optional<HashAlgorithm> parseHashAlgorithm(const std::string& value);

// Full 32-byte SHA-256 of an arbitrary buffer. Throws std::runtime_error if
// libcrypto fails.
std::string sha256Digest(const void* data, size_t size);

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_CONTENT_HASHER_HPP
