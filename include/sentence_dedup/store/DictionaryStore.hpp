// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_STORE_DICTIONARY_STORE_HPP
#define SENTENCE_DEDUP_STORE_DICTIONARY_STORE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/core/DedupTypes.hpp"
#include "sentence_dedup/core/SentenceDictionary.hpp"
#include "sentence_dedup/store/DictionaryJournal.hpp"
#include "sentence_dedup/store/FileLock.hpp"

namespace sentence_dedup {

namespace io {
struct DictionarySnapshot;
}

// hash_algorithm and boundary_rule are fixed when a store is created. Left
// unset, an existing store's values are adopted and a new store gets Sha256
// and LineAttached; set, they must match what the store recorded.
struct StoreSettings {
    std::string db_path = "dedupe_main.db";
    std::optional<HashAlgorithm> hash_algorithm;
    // Overrides hash_algorithm when set.
    std::shared_ptr<const ContentHasher> hasher;
    std::optional<BoundaryRule> boundary_rule;
    // Journal batches that trigger an automatic compaction; 0 disables it.
    size_t compact_threshold = 64;
    bool verbose = false;
};

enum class AccessMode {
    ReadOnly,
    ReadWrite,
};

// Persistent home of a SentenceDictionary.
//
// For a database path P the store owns P (HDF5 snapshot), P.journal
// (append-only batches committed since the snapshot) and P.lock. Opening
// takes the lock (shared for ReadOnly, exclusive for ReadWrite), loads the
// snapshot and replays the journal. commit() turns the dictionary's pending
// changes into one durable batch. A ReadOnly open of a path where nothing
// exists yet takes no lock and creates no file.
class DictionaryStore {
public:
    // Throws DedupError (DatabaseCorruption, ConfigMismatch, LockFailed).
    DictionaryStore(StoreSettings settings, AccessMode mode);
    ~DictionaryStore();

    DictionaryStore(const DictionaryStore&) = delete;
    DictionaryStore& operator=(const DictionaryStore&) = delete;

    SentenceDictionary& dictionary() { return *dictionary_; }
    const SentenceDictionary& dictionary() const { return *dictionary_; }

    BoundaryRule boundaryRule() const { return *settings_.boundary_rule; }
    AccessMode accessMode() const { return mode_; }

    // True when neither a snapshot nor any journal batch existed at open.
    bool isNew() const { return is_new_; }

    std::optional<EncodeMode> pinnedEncodeMode() const;
    // Records the mode with the next commit.
    void pinEncodeMode(EncodeMode mode);

    // Returns false when there was nothing to commit. On failure the
    // in-memory dictionary is rolled back and the error rethrown.
    bool commit();
    void rollback();

    // Commits pending changes, writes a fresh snapshot and empties the
    // journal.
    void compact();

    size_t journalBatchCount() const { return journal_.batchCount(); }
    uint64_t lastSequence() const { return next_sequence_ - 1; }
    const std::string& creationTime() const { return creation_time_; }

    const std::string& snapshotPath() const { return settings_.db_path; }
    const std::string& journalPath() const { return journal_.path(); }
    std::string lockPath() const { return settings_.db_path + ".lock"; }

private:
    StoreSettings settings_;
    AccessMode mode_;
    std::unique_ptr<FileLock> lock_;
    std::unique_ptr<SentenceDictionary> dictionary_;
    DictionaryJournal journal_;

    uint64_t next_sequence_ = 1;
    bool is_new_ = true;
    bool settings_pinned_ = false;
    std::optional<EncodeMode> committed_mode_;
    std::optional<EncodeMode> pending_mode_;
    std::string creation_time_;

    void load();
    void resolveSettings(const std::string& hash_algorithm, const std::string& boundary_rule);
    void restoreSnapshot(const io::DictionarySnapshot& snapshot);
    void applyPin(const PinRecord& pin);
    bool appendPending();
    void requireWritable(const char* operation) const;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_STORE_DICTIONARY_STORE_HPP
