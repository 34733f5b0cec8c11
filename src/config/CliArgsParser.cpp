// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/config/CliArgsParser.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace sentence_dedup::config {

namespace {

const std::string kEncodedSuffix = ".dat";

std::string requireValue(const std::vector<std::string>& args, size_t& index) {
    const std::string& flag = args[index];
    if (index + 1 >= args.size() || args[index + 1].empty()) {
        throw std::invalid_argument(flag + " requires a value");
    }
    ++index;
    return args[index];
}

void setOnce(std::string& target, const std::string& flag, const std::string& value) {
    if (!target.empty()) {
        throw std::invalid_argument(flag + " given more than once");
    }
    target = value;
}

void setOnce(std::optional<std::string>& target, const std::string& flag, const std::string& value) {
    if (target) {
        throw std::invalid_argument(flag + " given more than once");
    }
    target = value;
}

bool isUnsignedNumber(const std::string& value) {
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

}  // namespace

CliOptions parseCliArguments(const std::vector<std::string>& args) {
    CliOptions options;
    bool stats_requested = false;
    bool compact_requested = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            options.help = true;
        } else if (arg == "--seed") {
            setOnce(options.seed_pattern, arg, requireValue(args, i));
        } else if (arg == "--input") {
            setOnce(options.input_file, arg, requireValue(args, i));
        } else if (arg == "--output") {
            setOnce(options.output_file, arg, requireValue(args, i));
        } else if (arg == "--decode") {
            setOnce(options.decode_file, arg, requireValue(args, i));
        } else if (arg == "--stats") {
            if (stats_requested) {
                throw std::invalid_argument("--stats given more than once");
            }
            stats_requested = true;
            if (i + 1 < args.size() && isUnsignedNumber(args[i + 1])) {
                ++i;
                int limit = 0;
                try {
                    limit = std::stoi(args[i]);
                } catch (const std::out_of_range&) {
                    throw std::invalid_argument("--stats limit is out of range: " + args[i]);
                }
                if (limit <= 0) {
                    throw std::invalid_argument("--stats limit must be greater than zero");
                }
                options.stats_limit = limit;
            }
        } else if (arg == "--compact") {
            compact_requested = true;
        } else if (arg == "--config") {
            setOnce(options.config_path, arg, requireValue(args, i));
        } else if (arg == "--db") {
            setOnce(options.db_path, arg, requireValue(args, i));
        } else if (arg == "--mode") {
            setOnce(options.encode_mode, arg, requireValue(args, i));
        } else if (arg == "--hash") {
            setOnce(options.hash_algorithm, arg, requireValue(args, i));
        } else if (arg == "--boundary") {
            setOnce(options.boundary_rule, arg, requireValue(args, i));
        } else if (arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--allow-mode-switch") {
            options.allow_mode_switch = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }

    if (options.help) {
        return options;
    }

    if (!options.input_file.empty() && options.output_file.empty()) {
        throw std::invalid_argument("--input requires --output");
    }
    if (!options.output_file.empty() && options.input_file.empty() && options.decode_file.empty()) {
        throw std::invalid_argument("--output requires --input or --decode");
    }

    std::vector<CliCommand> commands;
    if (!options.seed_pattern.empty()) {
        commands.push_back(CliCommand::Seed);
    }
    if (!options.input_file.empty()) {
        commands.push_back(CliCommand::Encode);
    }
    if (!options.decode_file.empty()) {
        commands.push_back(CliCommand::Decode);
    }
    if (stats_requested) {
        commands.push_back(CliCommand::Stats);
    }
    if (compact_requested) {
        commands.push_back(CliCommand::Compact);
    }

    if (commands.empty()) {
        throw std::invalid_argument("Expected one of --seed, --input/--output, --decode, --stats or --compact");
    }
    if (commands.size() > 1) {
        throw std::invalid_argument("Only one operation may be given per invocation");
    }

    options.command = commands.front();
    return options;
}

void applyCliOverrides(const CliOptions& options, DedupConfig& config) {
    if (options.db_path) {
        config.db_path = *options.db_path;
    }
    if (options.encode_mode) {
        config.encode_mode = *options.encode_mode;
    }
    if (options.hash_algorithm) {
        config.hash_algorithm = *options.hash_algorithm;
    }
    if (options.boundary_rule) {
        config.boundary_rule = *options.boundary_rule;
    }
    if (options.stats_limit) {
        config.stats_limit = *options.stats_limit;
    }
    if (options.verbose) {
        config.verbose = true;
    }
    if (options.allow_mode_switch) {
        config.allow_mode_switch = true;
    }
}

std::string resolveEncodedOutputPath(const std::string& output) {
    if (output.size() >= kEncodedSuffix.size() &&
        output.compare(output.size() - kEncodedSuffix.size(), kEncodedSuffix.size(), kEncodedSuffix) == 0) {
        return output;
    }
    return output + kEncodedSuffix;
}

}  // namespace sentence_dedup::config
