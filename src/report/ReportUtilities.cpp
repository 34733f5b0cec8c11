// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/report/ReportUtilities.hpp"

#include <iomanip>
#include <sstream>

namespace sentence_dedup {

namespace {

double ratio(double numerator, double denominator) {
    return denominator > 0.0 ? numerator / denominator : 0.0;
}

}  // namespace

std::string formatSeedSummary(const services::SeedReport& report) {
    const auto& stats = report.statistics;
    std::ostringstream oss;
    oss << "[REPORT][Seed] summary:\n";
    oss << "  Files            : " << stats.files << "\n";
    oss << "  Input bytes      : " << stats.input_bytes << "\n";
    oss << "  Sentence units   : " << stats.units << " (" << stats.blank_units << " blank)\n";
    oss << "  New entries      : " << stats.new_entries << "\n";
    oss << "  Existing hits    : " << stats.existing_hits << "\n";
    oss << "  Hash collisions  : " << stats.collisions << "\n";
    oss << "  Dictionary size  : " << stats.dictionary_size << " entries";
    return oss.str();
}

std::string formatEncodeSummary(const services::EncodeReport& report) {
    const auto& stats = report.statistics;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "[REPORT][Encode] summary:\n";
    oss << "  Input            : " << report.input_file << " (" << stats.input_bytes << " bytes)\n";
    oss << "  Output           : " << report.output_file << " (" << report.output_bytes << " bytes)\n";
    oss << "  Mode             : " << toString(report.mode) << "\n";
    oss << "  Tokens           : " << (stats.references + stats.literals) << " (" << stats.references
        << " references, " << stats.literals << " literals)\n";
    oss << "  New entries      : " << stats.new_entries << "\n";
    oss << "  Size ratio       : "
        << ratio(static_cast<double>(report.output_bytes), static_cast<double>(stats.input_bytes));
    return oss.str();
}

std::string formatDecodeSummary(const services::DecodeReport& report) {
    const auto& stats = report.statistics;
    std::ostringstream oss;
    oss << "[REPORT][Decode] summary:\n";
    oss << "  Input            : " << report.input_file << "\n";
    oss << "  Output           : " << (report.output_file.empty() ? "<stdout>" : report.output_file) << "\n";
    oss << "  Tokens           : " << stats.tokens << " (" << stats.references << " references, "
        << stats.literals << " literals)\n";
    oss << "  Output bytes     : " << stats.output_bytes;
    return oss.str();
}

std::string formatCompactSummary(const services::CompactReport& report) {
    std::ostringstream oss;
    oss << "[REPORT][Compact] summary:\n";
    oss << "  Database         : " << report.db_path << "\n";
    oss << "  Entries          : " << report.entries << "\n";
    oss << "  Folded batches   : " << report.journal_batches_before << "\n";
    oss << "  Last sequence    : " << report.last_sequence;
    return oss.str();
}

std::string formatStatsReport(const services::StatsReport& report) {
    const auto& overview = report.overview;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    oss << "[REPORT][Stats] dictionary '" << report.db_path << "':\n";
    oss << "  Created          : " << (overview.creation_time.empty() ? "<unknown>" : overview.creation_time) << "\n";
    oss << "  Hash algorithm   : " << overview.hash_algorithm << "\n";
    oss << "  Boundary rule    : " << overview.boundary_rule << "\n";
    oss << "  Encode mode      : " << (overview.encode_mode.empty() ? "<unpinned>" : overview.encode_mode) << "\n";
    oss << "  Entries          : " << overview.entries << "\n";
    oss << "  Hash buckets     : " << overview.buckets << "\n";
    oss << "  Occurrences      : " << overview.total_occurrences << "\n";
    oss << "  Stored bytes     : " << overview.stored_bytes << "\n";
    oss << "  Dedupe factor    : "
        << ratio(static_cast<double>(overview.total_occurrences), static_cast<double>(overview.entries)) << "\n";
    oss << "  Journal batches  : " << overview.journal_batches << " (last sequence "
        << overview.last_sequence << ")";

    if (!overview.top_sentences.empty()) {
        oss << "\n  Top " << overview.top_sentences.size() << " sentences by occurrence:";
        for (const auto& sentence : overview.top_sentences) {
            oss << "\n    " << std::setw(8) << sentence.occurrence_count << "  #" << sentence.id << "  "
                << previewSentence(sentence.raw_bytes);
        }
    }
    return oss.str();
}

std::string previewSentence(const std::string& bytes, size_t max_length) {
    std::ostringstream oss;
    size_t emitted = 0;
    for (unsigned char c : bytes) {
        if (emitted >= max_length) {
            oss << "...";
            break;
        }
        if (c == '\n') {
            oss << "\\n";
        } else if (c == '\r') {
            oss << "\\r";
        } else if (c == '\t') {
            oss << "\\t";
        } else if (c < 0x20 || c == 0x7F) {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c)
                << std::dec << std::setfill(' ');
        } else {
            oss << static_cast<char>(c);
        }
        ++emitted;
    }
    return oss.str();
}

}  // namespace sentence_dedup
