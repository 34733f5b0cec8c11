// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/config/ConfigTransforms.hpp"

namespace sentence_dedup::config {

DedupSetup buildDedupSetup(const DedupConfig& config) {
    DedupSetup setup;
    setup.config = config;
    setup.store = settingsFromConfig(setup.config);
    setup.encode_mode = encodeModeFromConfig(setup.config);
    return setup;
}

DedupSetup buildDedupSetup(const CliOptions& options) {
    DedupConfig config;
    if (!options.config_path.empty()) {
        config = loadDedupConfigFromYaml(options.config_path);
    }
    applyCliOverrides(options, config);
    return buildDedupSetup(config);
}

std::vector<std::string> validateDedupSetup(const DedupSetup& setup) {
    return setup.config.validate();
}

}  // namespace sentence_dedup::config
