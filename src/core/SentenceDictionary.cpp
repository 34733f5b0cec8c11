// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/SentenceDictionary.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>

#include "sentence_dedup/core/DedupError.hpp"

namespace sentence_dedup {

SentenceDictionary::SentenceDictionary(std::shared_ptr<const ContentHasher> hasher)
    : hasher_(std::move(hasher)) {
    if (!hasher_) {
        throw std::invalid_argument("SentenceDictionary requires a content hasher");
    }
}

SentenceDictionary::~SentenceDictionary() = default;

std::optional<SentenceId> SentenceDictionary::lookup(const std::string& bytes) const {
    const ContentHash hash = hasher_->hash(bytes);
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return findLocked(hash, bytes);
}

InsertResult SentenceDictionary::insertOrGet(const std::string& bytes) {
    const ContentHash hash = hasher_->hash(bytes);
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& bucket = buckets_[hash];
    for (SentenceId candidate : bucket) {
        auto it = entries_.find(candidate);
        if (it != entries_.end() && it->second.raw_bytes == bytes) {
            incrementLocked(it->second);
            return {candidate, false};
        }
    }

    if (!bucket.empty()) {
        // Same hash, different bytes: the new content gets its own id in the
        // shared bucket.
        ++collision_count_;
        std::cerr << "[WARN][Dictionary] hash collision in bucket of size " << bucket.size()
                  << ", assigning id " << (max_id_ + 1) << std::endl;
    }

    Sentence sentence;
    sentence.id = max_id_ + 1;
    sentence.raw_bytes = bytes;
    sentence.content_hash = hash;
    sentence.occurrence_count = 1;

    const SentenceId id = sentence.id;
    entries_.emplace(id, std::move(sentence));
    bucket.push_back(id);
    max_id_ = id;
    ++total_occurrences_;
    pending_new_ids_.push_back(id);
    return {id, true};
}

std::optional<std::string> SentenceDictionary::get(SentenceId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.raw_bytes;
}

bool SentenceDictionary::recordOccurrence(SentenceId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    incrementLocked(it->second);
    return true;
}

std::optional<Sentence> SentenceDictionary::entry(SentenceId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Sentence> SentenceDictionary::entries() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Sentence> result;
    result.reserve(entries_.size());
    for (const auto& [id, sentence] : entries_) {
        result.push_back(sentence);
    }
    return result;
}

size_t SentenceDictionary::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}

SentenceId SentenceDictionary::maxId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return max_id_;
}

uint64_t SentenceDictionary::totalOccurrences() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return total_occurrences_;
}

uint64_t SentenceDictionary::collisionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return collision_count_;
}

size_t SentenceDictionary::bucketCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return buckets_.size();
}

void SentenceDictionary::restoreEntry(const Sentence& sentence) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (sentence.id != max_id_ + 1) {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "entry id does not follow the current maximum " + std::to_string(max_id_),
                         "",
                         sentence.id);
    }
    if (hasher_->hash(sentence.raw_bytes) != sentence.content_hash) {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "stored content hash does not match the entry bytes",
                         "",
                         sentence.id);
    }
    if (findLocked(sentence.content_hash, sentence.raw_bytes)) {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "entry duplicates the content of an existing id",
                         "",
                         sentence.id);
    }

    const SentenceId id = sentence.id;
    buckets_[sentence.content_hash].push_back(id);
    total_occurrences_ += sentence.occurrence_count;
    entries_.emplace(id, sentence);
    max_id_ = id;
    committed_max_id_ = id;
}

void SentenceDictionary::restoreOccurrences(SentenceId id, uint64_t delta) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "occurrence update for an unknown id",
                         "",
                         id);
    }
    it->second.occurrence_count += delta;
    total_occurrences_ += delta;
}

bool SentenceDictionary::hasPendingChanges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return !pending_new_ids_.empty() || !pending_count_deltas_.empty();
}

PendingChanges SentenceDictionary::pendingChanges() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    PendingChanges changes;
    changes.new_entries.reserve(pending_new_ids_.size());
    for (SentenceId id : pending_new_ids_) {
        changes.new_entries.push_back(entries_.at(id));
    }
    changes.count_deltas.assign(pending_count_deltas_.begin(), pending_count_deltas_.end());
    return changes;
}

void SentenceDictionary::markCommitted() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    pending_new_ids_.clear();
    pending_count_deltas_.clear();
    committed_max_id_ = max_id_;
}

void SentenceDictionary::discardPending() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    for (const auto& [id, delta] : pending_count_deltas_) {
        auto it = entries_.find(id);
        if (it != entries_.end()) {
            it->second.occurrence_count -= delta;
            total_occurrences_ -= delta;
        }
    }

    for (auto rit = pending_new_ids_.rbegin(); rit != pending_new_ids_.rend(); ++rit) {
        auto it = entries_.find(*rit);
        if (it == entries_.end()) {
            continue;
        }
        auto bucket_it = buckets_.find(it->second.content_hash);
        if (bucket_it != buckets_.end()) {
            auto& ids = bucket_it->second;
            ids.erase(std::remove(ids.begin(), ids.end(), *rit), ids.end());
            if (ids.empty()) {
                buckets_.erase(bucket_it);
            }
        }
        total_occurrences_ -= it->second.occurrence_count;
        entries_.erase(it);
    }

    pending_new_ids_.clear();
    pending_count_deltas_.clear();
    max_id_ = committed_max_id_;
}

std::optional<SentenceId> SentenceDictionary::findLocked(const ContentHash& hash,
                                                         const std::string& bytes) const {
    auto bucket_it = buckets_.find(hash);
    if (bucket_it == buckets_.end()) {
        return std::nullopt;
    }
    for (SentenceId candidate : bucket_it->second) {
        auto it = entries_.find(candidate);
        if (it != entries_.end() && it->second.raw_bytes == bytes) {
            return candidate;
        }
    }
    return std::nullopt;
}

void SentenceDictionary::incrementLocked(Sentence& sentence) {
    ++sentence.occurrence_count;
    ++total_occurrences_;
    // Uncommitted entries carry their final count in the NewEntry record.
    if (sentence.id > committed_max_id_) {
        return;
    }
    ++pending_count_deltas_[sentence.id];
}

}  // namespace sentence_dedup
