// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/store/DictionaryStore.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "sentence_dedup/core/DedupError.hpp"
#include "sentence_dedup/io/DictionarySnapshotIO.hpp"
#include "sentence_dedup/io/FileAccess.hpp"

namespace sentence_dedup {

namespace {

constexpr const char* kPinHashAlgorithm = "hash_algorithm";
constexpr const char* kPinBoundaryRule = "boundary_rule";
constexpr const char* kPinEncodeMode = "encode_mode";
constexpr const char* kPinCreationTime = "creation_time";

std::string currentUtcTimestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
    gmtime_r(&now, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// First value recorded for key; empty when no batch carries it.
std::string findPin(const JournalReadResult& journal, const std::string& key) {
    for (const auto& batch : journal.batches) {
        for (const auto& pin : batch.pins) {
            if (pin.key == key) {
                return pin.value;
            }
        }
    }
    return std::string();
}

double elapsedMs(std::chrono::high_resolution_clock::time_point t0) {
    auto t1 = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
}

}  // namespace

DictionaryStore::DictionaryStore(StoreSettings settings, AccessMode mode)
    : settings_(std::move(settings)),
      mode_(mode),
      journal_(settings_.db_path + ".journal") {
    if (settings_.db_path.empty()) {
        throw std::invalid_argument("DictionaryStore requires a database path");
    }

    std::error_code ec;
    const bool exists = std::filesystem::exists(settings_.db_path, ec) ||
                        std::filesystem::exists(journal_.path(), ec);
    if (mode_ == AccessMode::ReadOnly && !exists) {
        // Nothing to read; an empty dictionary with the configured settings.
        resolveSettings(std::string(), std::string());
        dictionary_ = std::make_unique<SentenceDictionary>(settings_.hasher);
        return;
    }

    lock_ = std::make_unique<FileLock>(lockPath(),
                                       mode_ == AccessMode::ReadWrite ? LockMode::Exclusive : LockMode::Shared);
    load();
}

DictionaryStore::~DictionaryStore() {
    if (dictionary_ && dictionary_->hasPendingChanges()) {
        std::cerr << "[WARN][DictionaryStore] discarding uncommitted changes for '"
                  << settings_.db_path << "'" << std::endl;
    }
}

void DictionaryStore::load() {
    auto t0 = std::chrono::high_resolution_clock::now();

    io::DictionarySnapshot snapshot;
    bool has_snapshot = false;
    std::error_code ec;
    if (std::filesystem::exists(settings_.db_path, ec)) {
        io::DictionarySnapshotIO snapshot_io;
        snapshot_io.setVerbose(settings_.verbose);
        if (!snapshot_io.read(settings_.db_path, snapshot)) {
            throw DedupError(ErrorKind::DatabaseCorruption,
                             "unreadable snapshot: " + snapshot_io.getLastError(),
                             settings_.db_path);
        }
        has_snapshot = true;
    }

    const JournalReadResult journal = journal_.read();

    if (has_snapshot) {
        resolveSettings(snapshot.hash_algorithm, snapshot.boundary_rule);
    } else {
        resolveSettings(findPin(journal, kPinHashAlgorithm), findPin(journal, kPinBoundaryRule));
    }
    dictionary_ = std::make_unique<SentenceDictionary>(settings_.hasher);

    uint64_t last_sequence = 0;
    if (has_snapshot) {
        restoreSnapshot(snapshot);
        last_sequence = snapshot.last_sequence;
        is_new_ = false;
        settings_pinned_ = true;
    }

    size_t replayed = 0;
    for (const auto& batch : journal.batches) {
        if (batch.sequence <= last_sequence) {
            // Already folded into the snapshot by an interrupted compaction.
            continue;
        }
        try {
            for (const auto& pin : batch.pins) {
                applyPin(pin);
            }
            for (const auto& sentence : batch.new_entries) {
                dictionary_->restoreEntry(sentence);
            }
            for (const auto& [id, delta] : batch.count_deltas) {
                dictionary_->restoreOccurrences(id, delta);
            }
        } catch (const DedupError& e) {
            if (e.kind() == ErrorKind::DatabaseCorruption) {
                throw DedupError(e.kind(),
                                 e.detail() + " in batch " + std::to_string(batch.sequence),
                                 journal_.path(),
                                 e.id());
            }
            throw;
        }
        last_sequence = batch.sequence;
        is_new_ = false;
        ++replayed;
    }
    next_sequence_ = last_sequence + 1;

    if (!is_new_ && !settings_pinned_) {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "journal does not record the store settings",
                         journal_.path());
    }

    if (journal.torn_tail) {
        std::cerr << "[WARN][DictionaryStore] ignoring torn journal tail at byte "
                  << journal.valid_length << " of " << journal.file_length << " in '"
                  << journal_.path() << "'" << std::endl;
    }

    if (settings_.verbose) {
        std::cout << "[PROFILE][DictionaryStore] load db='" << settings_.db_path
                  << "' entries=" << dictionary_->size()
                  << " replayed_batches=" << replayed
                  << " time=" << elapsedMs(t0) << " ms" << std::endl;
    }
}

void DictionaryStore::resolveSettings(const std::string& hash_algorithm, const std::string& boundary_rule) {
    if (!hash_algorithm.empty()) {
        if (settings_.hasher) {
            if (hash_algorithm != settings_.hasher->name()) {
                throw DedupError(ErrorKind::ConfigMismatch,
                                 "store uses hash algorithm '" + hash_algorithm + "' but '" +
                                     settings_.hasher->name() + "' is configured",
                                 settings_.db_path);
            }
        } else {
            const auto recorded = parseHashAlgorithm(hash_algorithm);
            if (!recorded) {
                throw DedupError(ErrorKind::DatabaseCorruption,
                                 "unknown hash algorithm '" + hash_algorithm + "'",
                                 settings_.db_path);
            }
            if (settings_.hash_algorithm && *settings_.hash_algorithm != *recorded) {
                throw DedupError(ErrorKind::ConfigMismatch,
                                 "store uses hash algorithm '" + hash_algorithm + "' but '" +
                                     toString(*settings_.hash_algorithm) + "' is configured",
                                 settings_.db_path);
            }
            settings_.hash_algorithm = recorded;
        }
    } else if (!settings_.hash_algorithm) {
        settings_.hash_algorithm = HashAlgorithm::Sha256;
    }
    if (!settings_.hasher) {
        settings_.hasher = makeContentHasher(*settings_.hash_algorithm);
    }

    if (!boundary_rule.empty()) {
        const auto recorded = parseBoundaryRule(boundary_rule);
        if (!recorded) {
            throw DedupError(ErrorKind::DatabaseCorruption,
                             "unknown boundary rule '" + boundary_rule + "'",
                             settings_.db_path);
        }
        if (settings_.boundary_rule && *settings_.boundary_rule != *recorded) {
            throw DedupError(ErrorKind::ConfigMismatch,
                             "store uses boundary rule '" + boundary_rule + "' but '" +
                                 toString(*settings_.boundary_rule) + "' is configured",
                             settings_.db_path);
        }
        settings_.boundary_rule = recorded;
    } else if (!settings_.boundary_rule) {
        settings_.boundary_rule = BoundaryRule::LineAttached;
    }
}

void DictionaryStore::restoreSnapshot(const io::DictionarySnapshot& snapshot) {
    creation_time_ = snapshot.creation_time;
    if (!snapshot.encode_mode.empty()) {
        applyPin({kPinEncodeMode, snapshot.encode_mode});
    }
    if (snapshot.digest_size != settings_.hasher->digestSize()) {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "snapshot digest size " + std::to_string(snapshot.digest_size) +
                             " does not match " + settings_.hasher->name(),
                         settings_.db_path);
    }

    try {
        for (const auto& sentence : snapshot.entries) {
            dictionary_->restoreEntry(sentence);
        }
    } catch (const DedupError& e) {
        throw DedupError(e.kind(), e.detail(), settings_.db_path, e.id());
    }
}

void DictionaryStore::applyPin(const PinRecord& pin) {
    if (pin.key == kPinHashAlgorithm) {
        if (pin.value != settings_.hasher->name()) {
            throw DedupError(ErrorKind::ConfigMismatch,
                             "store uses hash algorithm '" + pin.value + "' but '" +
                                 settings_.hasher->name() + "' is configured",
                             settings_.db_path);
        }
        settings_pinned_ = true;
    } else if (pin.key == kPinBoundaryRule) {
        if (pin.value != toString(*settings_.boundary_rule)) {
            throw DedupError(ErrorKind::ConfigMismatch,
                             "store uses boundary rule '" + pin.value + "' but '" +
                                 toString(*settings_.boundary_rule) + "' is configured",
                             settings_.db_path);
        }
    } else if (pin.key == kPinEncodeMode) {
        auto mode = parseEncodeMode(pin.value);
        if (!mode) {
            throw DedupError(ErrorKind::DatabaseCorruption,
                             "unknown pinned encode mode '" + pin.value + "'",
                             settings_.db_path);
        }
        committed_mode_ = mode;
    } else if (pin.key == kPinCreationTime) {
        creation_time_ = pin.value;
    } else {
        throw DedupError(ErrorKind::DatabaseCorruption,
                         "unknown pinned setting '" + pin.key + "'",
                         settings_.db_path);
    }
}

std::optional<EncodeMode> DictionaryStore::pinnedEncodeMode() const {
    return pending_mode_ ? pending_mode_ : committed_mode_;
}

void DictionaryStore::pinEncodeMode(EncodeMode mode) {
    requireWritable("pinEncodeMode");
    if (committed_mode_ == mode) {
        pending_mode_.reset();
        return;
    }
    pending_mode_ = mode;
}

bool DictionaryStore::commit() {
    requireWritable("commit");
    if (!appendPending()) {
        return false;
    }
    if (settings_.compact_threshold > 0 && journal_.batchCount() >= settings_.compact_threshold) {
        compact();
    }
    return true;
}

bool DictionaryStore::appendPending() {
    auto t0 = std::chrono::high_resolution_clock::now();

    JournalBatch batch;
    batch.sequence = next_sequence_;
    if (!settings_pinned_) {
        if (creation_time_.empty()) {
            creation_time_ = currentUtcTimestamp();
        }
        batch.pins.push_back({kPinHashAlgorithm, settings_.hasher->name()});
        batch.pins.push_back({kPinBoundaryRule, toString(*settings_.boundary_rule)});
        batch.pins.push_back({kPinCreationTime, creation_time_});
    }
    if (pending_mode_) {
        batch.pins.push_back({kPinEncodeMode, toString(*pending_mode_)});
    }

    PendingChanges changes = dictionary_->pendingChanges();
    batch.new_entries = std::move(changes.new_entries);
    batch.count_deltas = std::move(changes.count_deltas);

    if (batch.new_entries.empty() && batch.count_deltas.empty() && !pending_mode_) {
        return false;
    }

    try {
        journal_.append(batch);
    } catch (...) {
        rollback();
        throw;
    }

    dictionary_->markCommitted();
    ++next_sequence_;
    settings_pinned_ = true;
    is_new_ = false;
    if (pending_mode_) {
        committed_mode_ = pending_mode_;
        pending_mode_.reset();
    }

    if (settings_.verbose) {
        std::cout << "[PROFILE][DictionaryStore] commit seq=" << batch.sequence
                  << " new_entries=" << batch.new_entries.size()
                  << " count_deltas=" << batch.count_deltas.size()
                  << " time=" << elapsedMs(t0) << " ms" << std::endl;
    }
    return true;
}

void DictionaryStore::rollback() {
    dictionary_->discardPending();
    pending_mode_.reset();
}

void DictionaryStore::compact() {
    requireWritable("compact");
    auto t0 = std::chrono::high_resolution_clock::now();

    appendPending();

    io::DictionarySnapshot snapshot;
    snapshot.hash_algorithm = settings_.hasher->name();
    snapshot.boundary_rule = toString(*settings_.boundary_rule);
    snapshot.encode_mode = committed_mode_ ? toString(*committed_mode_) : std::string();
    snapshot.digest_size = static_cast<uint32_t>(settings_.hasher->digestSize());
    snapshot.last_sequence = next_sequence_ - 1;
    if (creation_time_.empty()) {
        creation_time_ = currentUtcTimestamp();
    }
    snapshot.creation_time = creation_time_;
    snapshot.entries = dictionary_->entries();

    const std::string temp_path = settings_.db_path + ".tmp";
    io::DictionarySnapshotIO snapshot_io;
    snapshot_io.setVerbose(settings_.verbose);
    if (!snapshot_io.write(temp_path, snapshot)) {
        throw DedupError(ErrorKind::WriteFailed,
                         "failed to write snapshot: " + snapshot_io.getLastError(),
                         temp_path);
    }

    std::error_code ec;
    try {
        io::syncFile(temp_path);
    } catch (const DedupError&) {
        std::filesystem::remove(temp_path, ec);
        throw;
    }

    std::filesystem::rename(temp_path, settings_.db_path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw DedupError(ErrorKind::WriteFailed,
                         "failed to move snapshot into place",
                         settings_.db_path);
    }
    // The snapshot must be durable before the journal batches it replaces
    // are dropped.
    io::syncParentDirectory(settings_.db_path);

    // A crash here leaves batches <= last_sequence in the journal; load()
    // skips them.
    journal_.reset();
    settings_pinned_ = true;
    is_new_ = false;

    if (settings_.verbose) {
        std::cout << "[PROFILE][DictionaryStore] compact db='" << settings_.db_path
                  << "' entries=" << snapshot.entries.size()
                  << " last_sequence=" << snapshot.last_sequence
                  << " time=" << elapsedMs(t0) << " ms" << std::endl;
    }
}

void DictionaryStore::requireWritable(const char* operation) const {
    if (mode_ != AccessMode::ReadWrite) {
        throw std::logic_error(std::string("DictionaryStore::") + operation +
                               " requires a read-write store");
    }
}

}  // namespace sentence_dedup
