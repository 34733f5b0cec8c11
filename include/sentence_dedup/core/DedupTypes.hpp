// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_DEDUP_TYPES_HPP
#define SENTENCE_DEDUP_CORE_DEDUP_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>

namespace sentence_dedup {

using SentenceId = uint64_t;

// Raw digest bytes produced by a ContentHasher.
using ContentHash = std::string;

struct Sentence {
    SentenceId id = 0;
    std::string raw_bytes;
    ContentHash content_hash;
    uint64_t occurrence_count = 0;
};

struct InsertResult {
    SentenceId id = 0;
    bool inserted = false;
};

// Line terminator that closed a sentence unit. Values are part of the
// reference stream wire format.
enum class Terminator : uint8_t {
    None = 0,
    LF = 1,
    CRLF = 2,
    CR = 3,
};

// LineAttached (the default) keeps each line's ending in its stored bytes, so
// "x\n" and "x\r\n" are different sentences. Line stores the content
// without the ending and folds line-ending variants together.
enum class BoundaryRule : uint8_t {
    Line = 0,
    LineAttached = 1,
};

enum class EncodeMode : uint8_t {
    Grow = 0,
    Strict = 1,
};

const char* terminatorBytes(Terminator terminator);

std::string toString(BoundaryRule rule);
std::string toString(EncodeMode mode);

std::optional<BoundaryRule> parseBoundaryRule(const std::string& value);
std::optional<EncodeMode> parseEncodeMode(const std::string& value);

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_DEDUP_TYPES_HPP
