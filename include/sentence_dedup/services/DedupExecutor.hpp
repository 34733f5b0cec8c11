// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_SERVICES_DEDUP_EXECUTOR_HPP
#define SENTENCE_DEDUP_SERVICES_DEDUP_EXECUTOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "sentence_dedup/config/ConfigTransforms.hpp"
#include "sentence_dedup/core/DedupError.hpp"
#include "sentence_dedup/core/StreamDecoder.hpp"
#include "sentence_dedup/core/StreamEncoder.hpp"

namespace sentence_dedup::services {

struct SeedStatistics {
    size_t files = 0;
    size_t units = 0;
    size_t blank_units = 0;
    size_t new_entries = 0;
    size_t existing_hits = 0;
    uint64_t collisions = 0;
    size_t input_bytes = 0;
    size_t dictionary_size = 0;
};

struct SeedReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::vector<std::string> files;
    SeedStatistics statistics;
    double elapsed_ms = 0.0;
};

struct EncodeReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::string input_file;
    std::string output_file;
    EncodeMode mode = EncodeMode::Grow;
    EncodeStatistics statistics;
    size_t output_bytes = 0;
    size_t dictionary_size = 0;
    double elapsed_ms = 0.0;
};

struct DecodeReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::string input_file;
    // Empty when the caller asked for the bytes instead of a file.
    std::string output_file;
    std::string decoded;
    DecodeStatistics statistics;
    double elapsed_ms = 0.0;
};

struct DictionaryOverview {
    size_t entries = 0;
    uint64_t total_occurrences = 0;
    uint64_t stored_bytes = 0;
    size_t buckets = 0;
    size_t journal_batches = 0;
    uint64_t last_sequence = 0;
    std::string hash_algorithm;
    std::string boundary_rule;
    std::string encode_mode;
    std::string creation_time;
    // Most frequent sentences, ties broken by id.
    std::vector<Sentence> top_sentences;
};

struct StatsReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::string db_path;
    DictionaryOverview overview;
};

struct CompactReport {
    bool success = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error_message;
    std::string db_path;
    size_t entries = 0;
    size_t journal_batches_before = 0;
    uint64_t last_sequence = 0;
    double elapsed_ms = 0.0;
};

// Runs one CLI operation against the configured store. Every operation
// catches the core's exceptions and reports them through its result struct.
class DedupExecutor {
public:
    explicit DedupExecutor(config::DedupSetup setup);

    SeedReport seedGlob(const std::string& pattern);
    // Reads every file before touching the store; if any read fails the
    // store is left exactly as it was.
    SeedReport seed(const std::vector<std::string>& files);

    // Commits the dictionary before the stream file is written.
    EncodeReport encode(const std::string& input_file, const std::string& output_file);

    // Without output_file the reconstructed bytes are returned in
    // DecodeReport::decoded.
    DecodeReport decode(const std::string& input_file,
                        const std::optional<std::string>& output_file = std::nullopt);

    StatsReport stats(size_t limit);
    CompactReport compact();

    const config::DedupSetup& setup() const { return setup_; }

private:
    config::DedupSetup setup_;

    template <typename Report>
    Report makeErrorReport(Report report, ErrorKind kind, const std::string& message) const;
};

}  // namespace sentence_dedup::services

#endif  // SENTENCE_DEDUP_SERVICES_DEDUP_EXECUTOR_HPP
