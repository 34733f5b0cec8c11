// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CONFIG_CONFIG_TRANSFORMS_HPP
#define SENTENCE_DEDUP_CONFIG_CONFIG_TRANSFORMS_HPP

#include <string>
#include <vector>

#include "sentence_dedup/config/CliArgsParser.hpp"
#include "sentence_dedup/config/DedupConfig.hpp"
#include "sentence_dedup/store/DictionaryStore.hpp"

namespace sentence_dedup::config {

struct DedupSetup {
    DedupConfig config;
    StoreSettings store;
    EncodeMode encode_mode = EncodeMode::Grow;
};

DedupSetup buildDedupSetup(const DedupConfig& config);

// Loads --config (when given) and layers the command line on top.
DedupSetup buildDedupSetup(const CliOptions& options);

std::vector<std::string> validateDedupSetup(const DedupSetup& setup);

}  // namespace sentence_dedup::config

#endif  // SENTENCE_DEDUP_CONFIG_CONFIG_TRANSFORMS_HPP
