// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CONFIG_CLI_ARGS_PARSER_HPP
#define SENTENCE_DEDUP_CONFIG_CLI_ARGS_PARSER_HPP

#include <optional>
#include <string>
#include <vector>

#include "sentence_dedup/config/DedupConfig.hpp"

namespace sentence_dedup::config {

enum class CliCommand {
    None,
    Seed,
    Encode,
    Decode,
    Stats,
    Compact,
};

struct CliOptions {
    CliCommand command = CliCommand::None;
    bool help = false;

    std::string seed_pattern;
    std::string input_file;
    std::string output_file;
    std::string decode_file;
    std::optional<int> stats_limit;

    std::string config_path;
    std::optional<std::string> db_path;
    std::optional<std::string> encode_mode;
    std::optional<std::string> hash_algorithm;
    std::optional<std::string> boundary_rule;
    bool verbose = false;
    bool allow_mode_switch = false;
};

// Parses argv[1..]. Exactly one of --seed, --input/--output, --decode,
// --stats and --compact must be given unless --help is. Throws
// std::invalid_argument with a message suitable for the user.
CliOptions parseCliArguments(const std::vector<std::string>& args);

// Command line values win over the YAML file.
void applyCliOverrides(const CliOptions& options, DedupConfig& config);

// "<output>.dat", unless output already ends in ".dat".
std::string resolveEncodedOutputPath(const std::string& output);

}  // namespace sentence_dedup::config

#endif  // SENTENCE_DEDUP_CONFIG_CLI_ARGS_PARSER_HPP
