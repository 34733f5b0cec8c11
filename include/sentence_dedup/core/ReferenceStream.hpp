// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_REFERENCE_STREAM_HPP
#define SENTENCE_DEDUP_CORE_REFERENCE_STREAM_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup {

enum class TokenKind : uint8_t {
    Reference = 0x1,
    Literal = 0x2,
};

struct StreamToken {
    TokenKind kind = TokenKind::Literal;
    SentenceId id = 0;
    std::string literal;
    Terminator terminator = Terminator::None;

    static StreamToken reference(SentenceId id, Terminator terminator = Terminator::None) {
        StreamToken token;
        token.kind = TokenKind::Reference;
        token.id = id;
        token.terminator = terminator;
        return token;
    }

    static StreamToken literalBytes(std::string bytes, Terminator terminator = Terminator::None) {
        StreamToken token;
        token.kind = TokenKind::Literal;
        token.literal = std::move(bytes);
        token.terminator = terminator;
        return token;
    }

    bool operator==(const StreamToken& other) const {
        return kind == other.kind && id == other.id && literal == other.literal &&
               terminator == other.terminator;
    }
};

struct StreamHeader {
    uint8_t version = 1;
    EncodeMode mode = EncodeMode::Grow;
    BoundaryRule boundary_rule = BoundaryRule::Line;
};

struct ReferenceStream {
    StreamHeader header;
    std::vector<StreamToken> tokens;

    size_t referenceCount() const;
    size_t literalCount() const;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_REFERENCE_STREAM_HPP
