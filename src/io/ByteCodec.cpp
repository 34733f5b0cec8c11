// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/io/ByteCodec.hpp"

namespace sentence_dedup::io {

namespace {

void appendLittleEndian(std::string& out, uint64_t value, size_t width) {
    for (size_t i = 0; i < width; ++i) {
        out.push_back(static_cast<char>((value >> (8 * i)) & 0xFFU));
    }
}

}

void appendU8(std::string& out, uint8_t value) {
    out.push_back(static_cast<char>(value));
}

void appendU16(std::string& out, uint16_t value) {
    appendLittleEndian(out, value, 2);
}

void appendU32(std::string& out, uint32_t value) {
    appendLittleEndian(out, value, 4);
}

void appendU64(std::string& out, uint64_t value) {
    appendLittleEndian(out, value, 8);
}

void appendVarint(std::string& out, uint64_t value) {
    while (value >= 0x80U) {
        out.push_back(static_cast<char>((value & 0x7FU) | 0x80U));
        value >>= 7;
    }
    out.push_back(static_cast<char>(value));
}

size_t varintSize(uint64_t value) {
    size_t size = 1;
    while (value >= 0x80U) {
        value >>= 7;
        ++size;
    }
    return size;
}

ByteReader::ByteReader(const std::string& buffer, size_t offset)
    : buffer_(buffer), pos_(offset > buffer.size() ? buffer.size() : offset) {}

bool ByteReader::readU8(uint8_t& value) {
    if (remaining() < 1) {
        return false;
    }
    value = static_cast<uint8_t>(buffer_[pos_]);
    ++pos_;
    return true;
}

bool ByteReader::readU16(uint16_t& value) {
    uint64_t wide = 0;
    if (!readLittleEndian(2, wide)) {
        return false;
    }
    value = static_cast<uint16_t>(wide);
    return true;
}

bool ByteReader::readU32(uint32_t& value) {
    uint64_t wide = 0;
    if (!readLittleEndian(4, wide)) {
        return false;
    }
    value = static_cast<uint32_t>(wide);
    return true;
}

bool ByteReader::readU64(uint64_t& value) {
    return readLittleEndian(8, value);
}

bool ByteReader::readVarint(uint64_t& value) {
    uint64_t result = 0;
    size_t cursor = pos_;
    for (unsigned shift = 0; shift < 64; shift += 7) {
        if (cursor >= buffer_.size()) {
            return false;
        }
        const uint8_t byte = static_cast<uint8_t>(buffer_[cursor++]);
        const uint64_t payload = byte & 0x7FU;
        // The tenth byte may only contribute the top bit.
        if (shift == 63 && payload > 1) {
            return false;
        }
        result |= payload << shift;
        if ((byte & 0x80U) == 0) {
            value = result;
            pos_ = cursor;
            return true;
        }
    }
    return false;
}

bool ByteReader::readBytes(size_t count, std::string& value) {
    if (remaining() < count) {
        return false;
    }
    value.assign(buffer_, pos_, count);
    pos_ += count;
    return true;
}

bool ByteReader::readLittleEndian(size_t width, uint64_t& value) {
    if (remaining() < width) {
        return false;
    }
    uint64_t result = 0;
    for (size_t i = 0; i < width; ++i) {
        result |= static_cast<uint64_t>(static_cast<uint8_t>(buffer_[pos_ + i])) << (8 * i);
    }
    value = result;
    pos_ += width;
    return true;
}

}  // namespace sentence_dedup::io
