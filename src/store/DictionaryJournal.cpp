// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/store/DictionaryJournal.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <system_error>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/core/DedupError.hpp"
#include "sentence_dedup/io/ByteCodec.hpp"
#include "sentence_dedup/io/FileAccess.hpp"

namespace sentence_dedup {

namespace {

constexpr char kJournalMagic[4] = {'S', 'D', 'J', '1'};
constexpr uint32_t kJournalVersion = 1;
constexpr size_t kJournalHeaderSize = 8;
constexpr uint32_t kBatchMagic = 0x48435442;  // "BTCH" little-endian
constexpr size_t kBatchHeaderSize = 4 + 8 + 8;
constexpr size_t kDigestSize = 32;

constexpr uint8_t kRecordNewEntry = 0x01;
constexpr uint8_t kRecordCountDelta = 0x02;
constexpr uint8_t kRecordPin = 0x03;

[[noreturn]] void corrupt(const std::string& path, uint64_t offset, const std::string& message) {
    std::ostringstream oss;
    oss << "journal " << message << " at byte " << offset;
    throw DedupError(ErrorKind::DatabaseCorruption, oss.str(), path);
}

std::string journalHeader() {
    std::string header(kJournalMagic, sizeof(kJournalMagic));
    io::appendU32(header, kJournalVersion);
    return header;
}

void writeAll(int fd, const std::string& bytes) {
    size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw std::system_error(errno, std::generic_category());
        }
        written += static_cast<size_t>(n);
    }
}

}  // namespace

DictionaryJournal::DictionaryJournal(std::string path)
    : path_(std::move(path)) {}

bool DictionaryJournal::exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

JournalReadResult DictionaryJournal::read() {
    JournalReadResult result;
    scanned_ = true;
    valid_length_ = 0;
    batch_count_ = 0;

    if (!exists()) {
        return result;
    }

    std::string bytes;
    try {
        bytes = io::readFileBytes(path_);
    } catch (const DedupError& e) {
        throw DedupError(ErrorKind::DatabaseCorruption, "journal unreadable: " + e.detail(), path_);
    }
    result.file_length = bytes.size();

    if (bytes.empty()) {
        return result;
    }
    if (bytes.size() < kJournalHeaderSize) {
        // Crash while the header itself was being written.
        result.torn_tail = true;
        return result;
    }
    if (std::memcmp(bytes.data(), kJournalMagic, sizeof(kJournalMagic)) != 0) {
        corrupt(path_, 0, "bad magic");
    }

    io::ByteReader reader(bytes, sizeof(kJournalMagic));
    uint32_t version = 0;
    reader.readU32(version);
    if (version != kJournalVersion) {
        corrupt(path_, 4, "unsupported version " + std::to_string(version));
    }

    uint64_t previous_sequence = 0;
    result.valid_length = kJournalHeaderSize;

    while (!reader.atEnd()) {
        const uint64_t batch_offset = reader.position();
        if (reader.remaining() < kBatchHeaderSize) {
            result.torn_tail = true;
            break;
        }

        uint32_t magic = 0;
        uint64_t sequence = 0;
        uint64_t payload_length = 0;
        reader.readU32(magic);
        reader.readU64(sequence);
        reader.readU64(payload_length);

        if (magic != kBatchMagic) {
            corrupt(path_, batch_offset, "bad batch marker");
        }
        if (payload_length > reader.remaining() || reader.remaining() - payload_length < kDigestSize) {
            result.torn_tail = true;
            break;
        }

        std::string payload;
        std::string stored_digest;
        reader.readBytes(static_cast<size_t>(payload_length), payload);
        reader.readBytes(kDigestSize, stored_digest);

        if (sha256Digest(payload.data(), payload.size()) != stored_digest) {
            if (reader.atEnd()) {
                result.torn_tail = true;
                break;
            }
            corrupt(path_, batch_offset, "batch digest mismatch");
        }
        if (sequence <= previous_sequence) {
            corrupt(path_, batch_offset, "batch sequence " + std::to_string(sequence) + " is not increasing");
        }

        JournalBatch batch;
        batch.sequence = sequence;
        decodePayload(payload, batch_offset + kBatchHeaderSize, batch);
        result.batches.push_back(std::move(batch));

        previous_sequence = sequence;
        result.valid_length = reader.position();
    }

    valid_length_ = result.valid_length;
    batch_count_ = result.batches.size();
    return result;
}

void DictionaryJournal::append(const JournalBatch& batch) {
    if (!scanned_) {
        read();
    }

    const std::string payload = encodePayload(batch);
    std::string bytes;
    if (valid_length_ == 0) {
        bytes = journalHeader();
    }
    io::appendU32(bytes, kBatchMagic);
    io::appendU64(bytes, batch.sequence);
    io::appendU64(bytes, payload.size());
    bytes += payload;
    bytes += sha256Digest(payload.data(), payload.size());

    int fd = ::open(path_.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw DedupError(ErrorKind::WriteFailed,
                         std::string("failed to open journal: ") + std::strerror(errno),
                         path_);
    }

    try {
        // Drops a torn tail (or a partial header) left by an earlier crash.
        if (::ftruncate(fd, static_cast<off_t>(valid_length_)) != 0 ||
            ::lseek(fd, static_cast<off_t>(valid_length_), SEEK_SET) < 0) {
            throw std::system_error(errno, std::generic_category());
        }
        writeAll(fd, bytes);
        if (::fsync(fd) != 0) {
            throw std::system_error(errno, std::generic_category());
        }
    } catch (const std::system_error& e) {
        if (::ftruncate(fd, static_cast<off_t>(valid_length_)) == 0) {
            ::fsync(fd);
        }
        ::close(fd);
        throw DedupError(ErrorKind::WriteFailed, std::string("failed to append batch: ") + e.what(), path_);
    }

    if (::close(fd) != 0) {
        throw DedupError(ErrorKind::WriteFailed, "failed to close journal", path_);
    }

    valid_length_ += bytes.size();
    ++batch_count_;
}

void DictionaryJournal::reset() {
    io::writeFileAtomically(path_, journalHeader());
    scanned_ = true;
    valid_length_ = kJournalHeaderSize;
    batch_count_ = 0;
}

std::string DictionaryJournal::encodePayload(const JournalBatch& batch) {
    std::string payload;

    for (const auto& pin : batch.pins) {
        io::appendU8(payload, kRecordPin);
        io::appendU8(payload, static_cast<uint8_t>(pin.key.size()));
        payload += pin.key;
        io::appendU16(payload, static_cast<uint16_t>(pin.value.size()));
        payload += pin.value;
    }

    for (const auto& sentence : batch.new_entries) {
        io::appendU8(payload, kRecordNewEntry);
        io::appendU64(payload, sentence.id);
        io::appendU8(payload, static_cast<uint8_t>(sentence.content_hash.size()));
        payload += sentence.content_hash;
        io::appendU64(payload, sentence.raw_bytes.size());
        payload += sentence.raw_bytes;
        io::appendU64(payload, sentence.occurrence_count);
    }

    for (const auto& [id, delta] : batch.count_deltas) {
        io::appendU8(payload, kRecordCountDelta);
        io::appendU64(payload, id);
        io::appendU64(payload, delta);
    }

    return payload;
}

void DictionaryJournal::decodePayload(const std::string& payload,
                                      uint64_t offset,
                                      JournalBatch& batch) const {
    io::ByteReader reader(payload);

    while (!reader.atEnd()) {
        const uint64_t record_offset = offset + reader.position();
        uint8_t type = 0;
        reader.readU8(type);

        if (type == kRecordNewEntry) {
            Sentence sentence;
            uint8_t hash_length = 0;
            uint64_t length = 0;
            bool ok = reader.readU64(sentence.id) && reader.readU8(hash_length) &&
                      reader.readBytes(hash_length, sentence.content_hash) && reader.readU64(length) &&
                      length <= reader.remaining() &&
                      reader.readBytes(static_cast<size_t>(length), sentence.raw_bytes) &&
                      reader.readU64(sentence.occurrence_count);
            if (!ok) {
                corrupt(path_, record_offset, "truncated NewEntry record");
            }
            batch.new_entries.push_back(std::move(sentence));
        } else if (type == kRecordCountDelta) {
            SentenceId id = 0;
            uint64_t delta = 0;
            if (!reader.readU64(id) || !reader.readU64(delta)) {
                corrupt(path_, record_offset, "truncated CountDelta record");
            }
            batch.count_deltas.emplace_back(id, delta);
        } else if (type == kRecordPin) {
            PinRecord pin;
            uint8_t key_length = 0;
            uint16_t value_length = 0;
            bool ok = reader.readU8(key_length) && reader.readBytes(key_length, pin.key) &&
                      reader.readU16(value_length) && reader.readBytes(value_length, pin.value);
            if (!ok) {
                corrupt(path_, record_offset, "truncated Pin record");
            }
            batch.pins.push_back(std::move(pin));
        } else {
            corrupt(path_, record_offset, "unknown record type " + std::to_string(type));
        }
    }
}

}  // namespace sentence_dedup
