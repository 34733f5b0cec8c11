// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/config/CliArgsParser.hpp"
#include "sentence_dedup/config/ConfigTransforms.hpp"
#include "sentence_dedup/report/ReportUtilities.hpp"
#include "sentence_dedup/services/DedupExecutor.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

using sentence_dedup::config::CliCommand;
using sentence_dedup::config::CliOptions;
using sentence_dedup::config::DedupSetup;
using sentence_dedup::config::buildDedupSetup;
using sentence_dedup::config::parseCliArguments;
using sentence_dedup::config::validateDedupSetup;
using sentence_dedup::services::DedupExecutor;

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " <operation> [options]\n";
    std::cout << "\nOperations (exactly one):\n";
    std::cout << "  --seed <glob>                     - Add every sentence of the matching files\n";
    std::cout << "  --input <file> --output <file>    - Encode a file into <file>.dat\n";
    std::cout << "  --decode <file> [--output <file>] - Rebuild the original bytes (stdout by default)\n";
    std::cout << "  --stats [N]                       - Dictionary report with the top N sentences\n";
    std::cout << "  --compact                         - Fold the journal into a fresh snapshot\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config <yaml>                   - Load settings from YAML\n";
    std::cout << "  --db <path>                       - Dictionary database (default dedupe_main.db)\n";
    std::cout << "  --mode grow|strict                - Encode mode\n";
    std::cout << "  --hash sha256|sha256_trunc32      - Content hash (fixed when the dictionary is created)\n";
    std::cout << "  --boundary line_attached|line     - Boundary rule (fixed when the dictionary is created)\n";
    std::cout << "  --allow-mode-switch               - Permit changing the pinned encode mode\n";
    std::cout << "  --verbose                         - Per-file and timing output\n";
}

// Sends everything written to std::cout to stderr for its lifetime so the
// real stdout carries only decoded bytes.
class StdoutToStderr {
public:
    StdoutToStderr() : original_(std::cout.rdbuf(std::cerr.rdbuf())) {}
    ~StdoutToStderr() { std::cout.rdbuf(original_); }

    StdoutToStderr(const StdoutToStderr&) = delete;
    StdoutToStderr& operator=(const StdoutToStderr&) = delete;

    std::streambuf* original() const { return original_; }

private:
    std::streambuf* original_;
};

int reportFailure(const std::string& message) {
    std::cerr << "Error: " << message << "\n";
    return 1;
}

int runDecode(DedupExecutor& executor, const CliOptions& options) {
    if (!options.output_file.empty()) {
        auto report = executor.decode(options.decode_file, options.output_file);
        if (!report.success) {
            return reportFailure(report.error_message);
        }
        std::cout << sentence_dedup::formatDecodeSummary(report) << "\n";
        return 0;
    }

    StdoutToStderr redirect;
    auto report = executor.decode(options.decode_file);
    if (!report.success) {
        return reportFailure(report.error_message);
    }

    std::ostream raw(redirect.original());
    raw.write(report.decoded.data(), static_cast<std::streamsize>(report.decoded.size()));
    raw.flush();
    if (!raw) {
        return reportFailure("failed to write decoded bytes to stdout");
    }
    if (executor.setup().config.verbose) {
        std::cerr << sentence_dedup::formatDecodeSummary(report) << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    CliOptions options;
    try {
        options = parseCliArguments(args);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        printUsage(argv[0]);
        return 1;
    }

    if (options.help) {
        printUsage(argv[0]);
        return 0;
    }

    DedupSetup setup;
    try {
        setup = buildDedupSetup(options);
    } catch (const std::exception& e) {
        std::cerr << "Failed to load config: " << e.what() << "\n";
        return 1;
    }

    auto errors = validateDedupSetup(setup);
    if (!errors.empty()) {
        for (const auto& err : errors) {
            std::cerr << "Config error: " << err << "\n";
        }
        return 1;
    }

    try {
        DedupExecutor executor(setup);

        switch (options.command) {
            case CliCommand::Seed: {
                auto report = executor.seedGlob(options.seed_pattern);
                if (!report.success) {
                    return reportFailure(report.error_message);
                }
                std::cout << sentence_dedup::formatSeedSummary(report) << "\n";
                break;
            }
            case CliCommand::Encode: {
                auto report = executor.encode(options.input_file, options.output_file);
                if (!report.success) {
                    return reportFailure(report.error_message);
                }
                std::cout << sentence_dedup::formatEncodeSummary(report) << "\n";
                break;
            }
            case CliCommand::Decode:
                return runDecode(executor, options);
            case CliCommand::Stats: {
                auto report = executor.stats(static_cast<size_t>(setup.config.stats_limit));
                if (!report.success) {
                    return reportFailure(report.error_message);
                }
                std::cout << sentence_dedup::formatStatsReport(report) << "\n";
                break;
            }
            case CliCommand::Compact: {
                auto report = executor.compact();
                if (!report.success) {
                    return reportFailure(report.error_message);
                }
                std::cout << sentence_dedup::formatCompactSummary(report) << "\n";
                break;
            }
            case CliCommand::None:
                printUsage(argv[0]);
                return 1;
        }
    } catch (const std::exception& e) {
        return reportFailure(e.what());
    }

    return 0;
}
