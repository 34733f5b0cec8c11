// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/io/ReferenceStreamIO.hpp"

#include <cstring>
#include <sstream>

#include "sentence_dedup/core/DedupError.hpp"
#include "sentence_dedup/io/ByteCodec.hpp"
#include "sentence_dedup/io/FileAccess.hpp"

namespace sentence_dedup::io {

namespace {

constexpr uint8_t kFlagStrict = 0x01;
constexpr uint8_t kFlagAttached = 0x02;
constexpr uint8_t kKnownFlags = kFlagStrict | kFlagAttached;

constexpr uint8_t kKindMask = 0x0F;
constexpr uint8_t kTerminatorShift = 4;
constexpr uint8_t kTerminatorMask = 0x03;
constexpr uint8_t kReservedBits = 0xC0;

[[noreturn]] void malformed(const std::string& source, size_t offset, const std::string& message) {
    std::ostringstream oss;
    oss << message << " at byte " << offset;
    throw DedupError(ErrorKind::MalformedStream, oss.str(), source);
}

uint8_t makeDiscriminator(const StreamToken& token) {
    return static_cast<uint8_t>(static_cast<uint8_t>(token.kind) |
                                (static_cast<uint8_t>(token.terminator) << kTerminatorShift));
}

}  // namespace

std::string serializeStream(const ReferenceStream& stream) {
    std::string out;
    out.append(kStreamMagic, sizeof(kStreamMagic));
    appendU8(out, kStreamVersion);

    uint8_t flags = 0;
    if (stream.header.mode == EncodeMode::Strict) {
        flags |= kFlagStrict;
    }
    if (stream.header.boundary_rule == BoundaryRule::LineAttached) {
        flags |= kFlagAttached;
    }
    appendU8(out, flags);

    for (const auto& token : stream.tokens) {
        appendU8(out, makeDiscriminator(token));
        if (token.kind == TokenKind::Reference) {
            appendVarint(out, token.id);
        } else {
            appendVarint(out, token.literal.size());
            out.append(token.literal);
        }
    }
    return out;
}

ReferenceStream parseStream(const std::string& bytes, const std::string& source) {
    if (bytes.size() < kStreamHeaderSize) {
        malformed(source, bytes.size(), "stream shorter than header");
    }
    if (std::memcmp(bytes.data(), kStreamMagic, sizeof(kStreamMagic)) != 0) {
        malformed(source, 0, "bad magic");
    }

    ByteReader reader(bytes, sizeof(kStreamMagic));
    uint8_t version = 0;
    uint8_t flags = 0;
    reader.readU8(version);
    reader.readU8(flags);

    if (version != kStreamVersion) {
        malformed(source, 4, "unsupported stream version " + std::to_string(version));
    }
    if ((flags & ~kKnownFlags) != 0) {
        malformed(source, 5, "unknown header flags");
    }

    ReferenceStream stream;
    stream.header.version = version;
    stream.header.mode = (flags & kFlagStrict) ? EncodeMode::Strict : EncodeMode::Grow;
    stream.header.boundary_rule =
        (flags & kFlagAttached) ? BoundaryRule::LineAttached : BoundaryRule::Line;

    while (!reader.atEnd()) {
        const size_t token_offset = reader.position();
        uint8_t discriminator = 0;
        reader.readU8(discriminator);

        if ((discriminator & kReservedBits) != 0) {
            malformed(source, token_offset, "reserved discriminator bits set");
        }
        const auto terminator =
            static_cast<Terminator>((discriminator >> kTerminatorShift) & kTerminatorMask);
        const uint8_t kind = discriminator & kKindMask;

        if (kind == static_cast<uint8_t>(TokenKind::Reference)) {
            uint64_t id = 0;
            if (!reader.readVarint(id)) {
                malformed(source, reader.position(), "truncated or oversized reference id");
            }
            if (id == 0) {
                malformed(source, token_offset, "reference id 0 is not valid");
            }
            stream.tokens.push_back(StreamToken::reference(id, terminator));
        } else if (kind == static_cast<uint8_t>(TokenKind::Literal)) {
            uint64_t length = 0;
            if (!reader.readVarint(length)) {
                malformed(source, reader.position(), "truncated or oversized literal length");
            }
            if (length > reader.remaining()) {
                malformed(source, reader.position(), "literal runs past end of stream");
            }
            std::string literal;
            reader.readBytes(static_cast<size_t>(length), literal);
            stream.tokens.push_back(StreamToken::literalBytes(std::move(literal), terminator));
        } else {
            malformed(source, token_offset, "unknown token kind " + std::to_string(kind));
        }
    }

    return stream;
}

void writeStreamFile(const std::string& path, const ReferenceStream& stream) {
    writeFileAtomically(path, serializeStream(stream));
}

ReferenceStream readStreamFile(const std::string& path) {
    return parseStream(readFileBytes(path), path);
}

}  // namespace sentence_dedup::io
