// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/services/DedupExecutor.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>

#include "sentence_dedup/core/SentenceSplitter.hpp"
#include "sentence_dedup/io/FileAccess.hpp"
#include "sentence_dedup/io/ReferenceStreamIO.hpp"
#include "sentence_dedup/store/DictionaryStore.hpp"
#include "sentence_dedup/utils/ErrorAccumulator.hpp"

namespace sentence_dedup::services {

namespace {

double elapsedMs(std::chrono::high_resolution_clock::time_point t0) {
    auto t1 = std::chrono::high_resolution_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
}

// Core errors raised below the file level do not know which file was being
// processed; attach it here.
std::string describe(const DedupError& error, const std::string& path) {
    if (!error.path().empty() || path.empty()) {
        return error.what();
    }
    return DedupError(error.kind(), error.detail(), path, error.id()).what();
}

}  // namespace

DedupExecutor::DedupExecutor(config::DedupSetup setup)
    : setup_(std::move(setup)) {}

template <typename Report>
Report DedupExecutor::makeErrorReport(Report report, ErrorKind kind, const std::string& message) const {
    report.success = false;
    report.error_kind = kind;
    report.error_message = message;
    return report;
}

SeedReport DedupExecutor::seedGlob(const std::string& pattern) {
    std::vector<std::string> files;
    try {
        files = io::expandGlob(pattern);
    } catch (const DedupError& e) {
        return makeErrorReport(SeedReport{}, e.kind(), e.what());
    }
    if (files.empty()) {
        return makeErrorReport(SeedReport{}, ErrorKind::FileNotFound, "no files match '" + pattern + "'");
    }
    return seed(files);
}

SeedReport DedupExecutor::seed(const std::vector<std::string>& files) {
    auto t0 = std::chrono::high_resolution_clock::now();
    SeedReport report;
    report.files = files;

    if (files.empty()) {
        return makeErrorReport(report, ErrorKind::FileNotFound, "no input files to seed");
    }

    std::vector<std::string> contents;
    contents.reserve(files.size());
    utils::ErrorAccumulator errors;
    for (const auto& file : files) {
        try {
            contents.push_back(io::readFileBytes(file));
        } catch (const DedupError& e) {
            errors.add(e);
        }
    }
    if (!errors.empty()) {
        return makeErrorReport(report,
                               errors.firstKind(),
                               std::to_string(errors.count()) + " of " + std::to_string(files.size()) +
                                   " input file(s) could not be read: " + errors.str());
    }

    SeedStatistics& stats = report.statistics;
    try {
        DictionaryStore store(setup_.store, AccessMode::ReadWrite);
        SentenceDictionary& dictionary = store.dictionary();
        const uint64_t collisions_before = dictionary.collisionCount();
        SentenceSplitter splitter(store.boundaryRule());

        for (size_t i = 0; i < files.size(); ++i) {
            size_t file_units = 0;
            size_t file_new = 0;
            stats.input_bytes += contents[i].size();

            for (const auto& unit : splitter.split(contents[i])) {
                ++stats.units;
                ++file_units;
                if (SentenceSplitter::isBlank(unit)) {
                    ++stats.blank_units;
                    continue;
                }
                const InsertResult result = dictionary.insertOrGet(unit.content);
                if (result.inserted) {
                    ++stats.new_entries;
                    ++file_new;
                } else {
                    ++stats.existing_hits;
                }
            }

            if (setup_.config.verbose) {
                std::cout << "[PROFILE][Seed] file='" << files[i] << "' units=" << file_units
                          << " new_entries=" << file_new << std::endl;
            }
        }

        store.commit();
        stats.files = files.size();
        stats.collisions = dictionary.collisionCount() - collisions_before;
        stats.dictionary_size = dictionary.size();
    } catch (const DedupError& e) {
        return makeErrorReport(report, e.kind(), e.what());
    } catch (const std::exception& e) {
        return makeErrorReport(report, ErrorKind::None, std::string("Seed failed: ") + e.what());
    }

    report.success = true;
    report.elapsed_ms = elapsedMs(t0);
    return report;
}

EncodeReport DedupExecutor::encode(const std::string& input_file, const std::string& output_file) {
    auto t0 = std::chrono::high_resolution_clock::now();
    EncodeReport report;
    report.input_file = input_file;
    report.output_file = config::resolveEncodedOutputPath(output_file);
    report.mode = setup_.encode_mode;

    try {
        const std::string bytes = io::readFileBytes(input_file);

        DictionaryStore store(setup_.store, AccessMode::ReadWrite);
        const auto pinned = store.pinnedEncodeMode();
        if (pinned && *pinned != report.mode) {
            if (!setup_.config.allow_mode_switch) {
                throw DedupError(ErrorKind::ConfigMismatch,
                                 "store is pinned to encode mode '" + toString(*pinned) +
                                     "'; refusing '" + toString(report.mode) +
                                     "' without --allow-mode-switch",
                                 store.snapshotPath());
            }
            std::cerr << "[WARN][DedupExecutor] switching pinned encode mode from '" << toString(*pinned)
                      << "' to '" << toString(report.mode) << "'" << std::endl;
        }
        store.pinEncodeMode(report.mode);

        StreamEncoder encoder(store.boundaryRule());
        const ReferenceStream stream = encoder.encode(bytes, store.dictionary(), report.mode);

        // The stream may only reference ids that are already durable.
        store.commit();

        const std::string serialized = io::serializeStream(stream);
        io::writeFileAtomically(report.output_file, serialized);

        report.statistics = encoder.getLastStatistics();
        report.output_bytes = serialized.size();
        report.dictionary_size = store.dictionary().size();
    } catch (const DedupError& e) {
        return makeErrorReport(report, e.kind(), describe(e, input_file));
    } catch (const std::exception& e) {
        return makeErrorReport(report, ErrorKind::None, std::string("Encode failed: ") + e.what());
    }

    report.success = true;
    report.elapsed_ms = elapsedMs(t0);
    return report;
}

DecodeReport DedupExecutor::decode(const std::string& input_file,
                                   const std::optional<std::string>& output_file) {
    auto t0 = std::chrono::high_resolution_clock::now();
    DecodeReport report;
    report.input_file = input_file;

    try {
        const ReferenceStream stream = io::readStreamFile(input_file);

        // The stream records the rule its store was created with.
        StoreSettings settings = setup_.store;
        settings.boundary_rule = stream.header.boundary_rule;
        DictionaryStore store(settings, AccessMode::ReadOnly);

        StreamDecoder decoder;
        std::string bytes = decoder.decode(stream, store.dictionary());
        report.statistics = decoder.getLastStatistics();

        if (output_file) {
            io::writeFileAtomically(*output_file, bytes);
            report.output_file = *output_file;
        } else {
            report.decoded = std::move(bytes);
        }
    } catch (const DedupError& e) {
        return makeErrorReport(report, e.kind(), describe(e, input_file));
    } catch (const std::exception& e) {
        return makeErrorReport(report, ErrorKind::None, std::string("Decode failed: ") + e.what());
    }

    report.success = true;
    report.elapsed_ms = elapsedMs(t0);
    return report;
}

StatsReport DedupExecutor::stats(size_t limit) {
    StatsReport report;
    report.db_path = setup_.store.db_path;

    try {
        DictionaryStore store(setup_.store, AccessMode::ReadOnly);
        const SentenceDictionary& dictionary = store.dictionary();
        DictionaryOverview& overview = report.overview;

        std::vector<Sentence> entries = dictionary.entries();
        overview.entries = entries.size();
        overview.total_occurrences = dictionary.totalOccurrences();
        overview.buckets = dictionary.bucketCount();
        overview.journal_batches = store.journalBatchCount();
        overview.last_sequence = store.lastSequence();
        overview.hash_algorithm = dictionary.hasher().name();
        overview.boundary_rule = toString(store.boundaryRule());
        const auto pinned = store.pinnedEncodeMode();
        overview.encode_mode = pinned ? toString(*pinned) : std::string();
        overview.creation_time = store.creationTime();
        for (const auto& sentence : entries) {
            overview.stored_bytes += sentence.raw_bytes.size();
        }

        std::sort(entries.begin(), entries.end(), [](const Sentence& a, const Sentence& b) {
            if (a.occurrence_count != b.occurrence_count) {
                return a.occurrence_count > b.occurrence_count;
            }
            return a.id < b.id;
        });
        if (entries.size() > limit) {
            entries.resize(limit);
        }
        overview.top_sentences = std::move(entries);
    } catch (const DedupError& e) {
        return makeErrorReport(report, e.kind(), e.what());
    } catch (const std::exception& e) {
        return makeErrorReport(report, ErrorKind::None, std::string("Stats failed: ") + e.what());
    }

    report.success = true;
    return report;
}

CompactReport DedupExecutor::compact() {
    auto t0 = std::chrono::high_resolution_clock::now();
    CompactReport report;
    report.db_path = setup_.store.db_path;

    try {
        DictionaryStore store(setup_.store, AccessMode::ReadWrite);
        report.journal_batches_before = store.journalBatchCount();
        store.compact();
        report.entries = store.dictionary().size();
        report.last_sequence = store.lastSequence();
    } catch (const DedupError& e) {
        return makeErrorReport(report, e.kind(), e.what());
    } catch (const std::exception& e) {
        return makeErrorReport(report, ErrorKind::None, std::string("Compact failed: ") + e.what());
    }

    report.success = true;
    report.elapsed_ms = elapsedMs(t0);
    return report;
}

}  // namespace sentence_dedup::services
