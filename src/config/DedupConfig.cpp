// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/config/DedupConfig.hpp"

#include <yaml-cpp/yaml.h>

#include "sentence_dedup/core/ContentHasher.hpp"

namespace sentence_dedup::config {

namespace {

YAML::Node extractParameterNode(const YAML::Node& root) {
    if (!root || root.IsNull()) {
        return YAML::Node();
    }

    if (root["sentence_dedup"]) {
        return root["sentence_dedup"];
    }

    return root;
}

template <typename T>
T readOrDefault(const YAML::Node& node, const std::string& key, const T& default_value) {
    if (!node || !node[key]) {
        return default_value;
    }
    return node[key].as<T>();
}

}  // namespace

DedupConfig loadDedupConfigFromYaml(const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);
    YAML::Node params = extractParameterNode(root);

    DedupConfig config;
    config.db_path = readOrDefault<std::string>(params, "db_path", config.db_path);
    config.encode_mode = readOrDefault<std::string>(params, "encode_mode", config.encode_mode);
    config.hash_algorithm = readOrDefault<std::string>(params, "hash_algorithm", config.hash_algorithm);
    config.boundary_rule = readOrDefault<std::string>(params, "boundary_rule", config.boundary_rule);
    config.compact_threshold = readOrDefault<int>(params, "compact_threshold", config.compact_threshold);
    config.allow_mode_switch = readOrDefault<bool>(params, "allow_mode_switch", config.allow_mode_switch);
    config.verbose = readOrDefault<bool>(params, "verbose", config.verbose);
    config.stats_limit = readOrDefault<int>(params, "stats_limit", config.stats_limit);
    return config;
}

std::vector<std::string> DedupConfig::validate() const {
    std::vector<std::string> errors;
    if (db_path.empty()) {
        errors.emplace_back("db_path is empty");
    }
    if (!parseEncodeMode(encode_mode)) {
        errors.emplace_back("encode_mode must be 'grow' or 'strict': " + encode_mode);
    }
    if (!hash_algorithm.empty() && !parseHashAlgorithm(hash_algorithm)) {
        errors.emplace_back("hash_algorithm must be 'sha256' or 'sha256_trunc32': " + hash_algorithm);
    }
    if (!boundary_rule.empty() && !parseBoundaryRule(boundary_rule)) {
        errors.emplace_back("boundary_rule must be 'line' or 'line_attached': " + boundary_rule);
    }
    if (compact_threshold < 0) {
        errors.emplace_back("compact_threshold must be non-negative");
    }
    if (stats_limit <= 0) {
        errors.emplace_back("stats_limit must be greater than zero");
    }
    return errors;
}

StoreSettings settingsFromConfig(const DedupConfig& config) {
    StoreSettings settings;
    settings.db_path = config.db_path;
    settings.hash_algorithm = parseHashAlgorithm(config.hash_algorithm);
    settings.boundary_rule = parseBoundaryRule(config.boundary_rule);
    settings.compact_threshold = config.compact_threshold > 0 ? static_cast<size_t>(config.compact_threshold) : 0;
    settings.verbose = config.verbose;
    return settings;
}

EncodeMode encodeModeFromConfig(const DedupConfig& config) {
    return parseEncodeMode(config.encode_mode).value_or(EncodeMode::Grow);
}

}  // namespace sentence_dedup::config
