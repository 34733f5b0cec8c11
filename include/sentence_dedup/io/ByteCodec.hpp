// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_IO_BYTE_CODEC_HPP
#define SENTENCE_DEDUP_IO_BYTE_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace sentence_dedup::io {

// Little-endian fixed width and unsigned LEB128 helpers shared by the
// reference stream and the dictionary journal.
void appendU8(std::string& out, uint8_t value);
void appendU16(std::string& out, uint16_t value);
void appendU32(std::string& out, uint32_t value);
void appendU64(std::string& out, uint64_t value);
void appendVarint(std::string& out, uint64_t value);

size_t varintSize(uint64_t value);

// Bounds-checked cursor over a byte buffer. Every read returns false instead
// of running past the end; the cursor is left unchanged on failure.
class ByteReader {
public:
    ByteReader(const std::string& buffer, size_t offset = 0);

    bool readU8(uint8_t& value);
    bool readU16(uint16_t& value);
    bool readU32(uint32_t& value);
    bool readU64(uint64_t& value);
    // Fails on truncation and on encodings longer than ten bytes or
    // overflowing 64 bits.
    bool readVarint(uint64_t& value);
    bool readBytes(size_t count, std::string& value);

    size_t position() const { return pos_; }
    size_t remaining() const { return buffer_.size() - pos_; }
    bool atEnd() const { return pos_ >= buffer_.size(); }

private:
    const std::string& buffer_;
    size_t pos_;

    bool readLittleEndian(size_t width, uint64_t& value);
};

}  // namespace sentence_dedup::io

#endif  // SENTENCE_DEDUP_IO_BYTE_CODEC_HPP
