// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_IO_REFERENCE_STREAM_IO_HPP
#define SENTENCE_DEDUP_IO_REFERENCE_STREAM_IO_HPP

#include <cstdint>
#include <string>

#include "sentence_dedup/core/ReferenceStream.hpp"

namespace sentence_dedup::io {

// Encoded file layout:
//   "SDRS" | u8 version | u8 flags (bit0 strict mode, bit1 attached boundary)
//   token*: u8 discriminator | payload
// Discriminator low nibble is the TokenKind, bits 4-5 the Terminator.
// Reference payload: LEB128 id. Literal payload: LEB128 length + bytes.
inline constexpr char kStreamMagic[4] = {'S', 'D', 'R', 'S'};
inline constexpr uint8_t kStreamVersion = 1;
inline constexpr size_t kStreamHeaderSize = 6;

std::string serializeStream(const ReferenceStream& stream);

// Throws DedupError(MalformedStream) on any framing error.
ReferenceStream parseStream(const std::string& bytes, const std::string& source = "");

// Writes through a temporary sibling file and renames it into place.
void writeStreamFile(const std::string& path, const ReferenceStream& stream);
ReferenceStream readStreamFile(const std::string& path);

}  // namespace sentence_dedup::io

#endif  // SENTENCE_DEDUP_IO_REFERENCE_STREAM_IO_HPP
