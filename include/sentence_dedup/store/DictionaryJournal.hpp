// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_STORE_DICTIONARY_JOURNAL_HPP
#define SENTENCE_DEDUP_STORE_DICTIONARY_JOURNAL_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup {

// Store setting recorded in the journal ("hash_algorithm", "boundary_rule",
// "encode_mode").
struct PinRecord {
    std::string key;
    std::string value;
};

struct JournalBatch {
    uint64_t sequence = 0;
    std::vector<PinRecord> pins;
    std::vector<Sentence> new_entries;
    std::vector<std::pair<SentenceId, uint64_t>> count_deltas;

    bool empty() const { return pins.empty() && new_entries.empty() && count_deltas.empty(); }
};

struct JournalReadResult {
    std::vector<JournalBatch> batches;
    uint64_t valid_length = 0;
    uint64_t file_length = 0;
    bool torn_tail = false;
};

// Append-only log of committed batches.
//
// File layout: "SDJ1" | u32 version, then per batch
//   u32 'BTCH' | u64 sequence | u64 payload_length | payload | SHA-256(payload)
// Payload records:
//   0x01 NewEntry   u64 id | u8 hash_len | hash | u64 len | bytes | u64 count
//   0x02 CountDelta u64 id | u64 delta
//   0x03 Pin        u8 key_len | key | u16 value_len | value
//
// A batch that runs past the end of the file, or whose digest fails and
// which is the last thing in the file, is a torn write and is dropped. Any
// other framing problem is DatabaseCorruption.
class DictionaryJournal {
public:
    explicit DictionaryJournal(std::string path);

    const std::string& path() const { return path_; }
    bool exists() const;

    // Throws DedupError(DatabaseCorruption).
    JournalReadResult read();

    // Writes one batch and fsyncs it. A torn tail found by read() is cut off
    // first. Throws DedupError(WriteFailed); the file is restored to its
    // previous length on failure.
    void append(const JournalBatch& batch);

    // Replaces the journal with an empty one.
    void reset();

    size_t batchCount() const { return batch_count_; }

    static std::string encodePayload(const JournalBatch& batch);

private:
    std::string path_;
    uint64_t valid_length_ = 0;
    size_t batch_count_ = 0;
    bool scanned_ = false;

    void decodePayload(const std::string& payload, uint64_t offset, JournalBatch& batch) const;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_STORE_DICTIONARY_JOURNAL_HPP
