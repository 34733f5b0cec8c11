// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_REPORT_REPORT_UTILITIES_HPP
#define SENTENCE_DEDUP_REPORT_REPORT_UTILITIES_HPP

#include <cstddef>
#include <string>

#include "sentence_dedup/services/DedupExecutor.hpp"

namespace sentence_dedup {

std::string formatSeedSummary(const services::SeedReport& report);

std::string formatEncodeSummary(const services::EncodeReport& report);

std::string formatDecodeSummary(const services::DecodeReport& report);

std::string formatCompactSummary(const services::CompactReport& report);

// Dictionary overview followed by the most frequent sentences.
std::string formatStatsReport(const services::StatsReport& report);

// Printable, single-line rendering of a sentence for tables. Control bytes
// are escaped and long content is cut at max_length.
std::string previewSentence(const std::string& bytes, size_t max_length = 60);

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_REPORT_REPORT_UTILITIES_HPP
