// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_SENTENCE_DICTIONARY_HPP
#define SENTENCE_DEDUP_CORE_SENTENCE_DICTIONARY_HPP

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup {

// Mutations made since the last commit, in the order the journal must
// replay them.
struct PendingChanges {
    std::vector<Sentence> new_entries;
    std::vector<std::pair<SentenceId, uint64_t>> count_deltas;

    bool empty() const { return new_entries.empty() && count_deltas.empty(); }
};

// Content-addressed sentence store.
//
// Each hash bucket holds every id whose bytes produced that hash; an id is
// only reused after its raw bytes compare equal to the probe. Ids start at 1,
// grow by one and are never renumbered or reclaimed.
//
// Thread safety: lookup/get take a shared lock, every mutating call an
// exclusive one, so concurrent insertOrGet of identical bytes yields one id.
class SentenceDictionary {
public:
    explicit SentenceDictionary(std::shared_ptr<const ContentHasher> hasher);
    ~SentenceDictionary();

    SentenceDictionary(const SentenceDictionary&) = delete;
    SentenceDictionary& operator=(const SentenceDictionary&) = delete;

    std::optional<SentenceId> lookup(const std::string& bytes) const;
    InsertResult insertOrGet(const std::string& bytes);
    std::optional<std::string> get(SentenceId id) const;

    // Counts one more sighting of an existing entry. Returns false for an
    // unknown id.
    bool recordOccurrence(SentenceId id);

    std::optional<Sentence> entry(SentenceId id) const;
    std::vector<Sentence> entries() const;

    size_t size() const;
    SentenceId maxId() const;
    uint64_t totalOccurrences() const;
    uint64_t collisionCount() const;
    size_t bucketCount() const;

    const ContentHasher& hasher() const { return *hasher_; }

    // Persistence hooks. restore* validate against the invariants and throw
    // DedupError(DatabaseCorruption) on violation; they are not recorded as
    // pending changes.
    void restoreEntry(const Sentence& sentence);
    void restoreOccurrences(SentenceId id, uint64_t delta);

    bool hasPendingChanges() const;
    PendingChanges pendingChanges() const;
    void markCommitted();
    void discardPending();

private:
    std::shared_ptr<const ContentHasher> hasher_;

    std::map<SentenceId, Sentence> entries_;
    std::unordered_map<ContentHash, std::vector<SentenceId>> buckets_;
    SentenceId max_id_ = 0;
    SentenceId committed_max_id_ = 0;
    uint64_t total_occurrences_ = 0;
    uint64_t collision_count_ = 0;

    std::vector<SentenceId> pending_new_ids_;
    std::map<SentenceId, uint64_t> pending_count_deltas_;

    mutable std::shared_mutex mutex_;

    std::optional<SentenceId> findLocked(const ContentHash& hash, const std::string& bytes) const;
    void incrementLocked(Sentence& sentence);
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_SENTENCE_DICTIONARY_HPP
