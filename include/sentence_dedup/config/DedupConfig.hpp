// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CONFIG_DEDUP_CONFIG_HPP
#define SENTENCE_DEDUP_CONFIG_DEDUP_CONFIG_HPP

#include <string>
#include <vector>

#include "sentence_dedup/core/DedupTypes.hpp"
#include "sentence_dedup/store/DictionaryStore.hpp"

namespace sentence_dedup::config {

struct DedupConfig {
    std::string db_path = "dedupe_main.db";
    std::string encode_mode = "grow";
    // Empty adopts what the store recorded at creation (sha256 and
    // line_attached for a new store).
    std::string hash_algorithm;
    std::string boundary_rule;
    int compact_threshold = 64;
    bool allow_mode_switch = false;
    bool verbose = false;
    int stats_limit = 50;

    std::vector<std::string> validate() const;
};

// Keys may sit at the document root or under a "sentence_dedup" node.
DedupConfig loadDedupConfigFromYaml(const std::string& path);

// Empty or unknown hash and boundary strings stay unset; validate() reports
// the unknown ones. An unknown encode mode falls back to grow.
StoreSettings settingsFromConfig(const DedupConfig& config);
EncodeMode encodeModeFromConfig(const DedupConfig& config);

}  // namespace sentence_dedup::config

#endif  // SENTENCE_DEDUP_CONFIG_DEDUP_CONFIG_HPP
