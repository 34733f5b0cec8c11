// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "sentence_dedup/config/ConfigTransforms.hpp"
#include "sentence_dedup/config/DedupConfig.hpp"

using sentence_dedup::BoundaryRule;
using sentence_dedup::EncodeMode;
using sentence_dedup::HashAlgorithm;
using sentence_dedup::config::CliOptions;
using sentence_dedup::config::DedupConfig;
using sentence_dedup::config::buildDedupSetup;
using sentence_dedup::config::loadDedupConfigFromYaml;
using sentence_dedup::config::settingsFromConfig;
using sentence_dedup::config::validateDedupSetup;

namespace {

std::string writeTempYaml(const std::string& contents) {
    auto temp_dir = std::filesystem::temp_directory_path();
    auto path = temp_dir / std::filesystem::path("sentence_dedup_config_test.yaml");
    std::ofstream ofs(path);
    ofs << contents;
    ofs.close();
    return path.string();
}

}  // namespace

TEST(DedupConfigTest, LoadsValuesFromYaml) {
    const std::string yaml = R"(
sentence_dedup:
  db_path: "/tmp/forecasts.db"
  encode_mode: strict
  hash_algorithm: sha256_trunc32
  boundary_rule: line_attached
  compact_threshold: 8
  allow_mode_switch: true
  verbose: true
  stats_limit: 5
)";

    const auto path = writeTempYaml(yaml);
    auto config = loadDedupConfigFromYaml(path);

    EXPECT_EQ("/tmp/forecasts.db", config.db_path);
    EXPECT_EQ("strict", config.encode_mode);
    EXPECT_EQ("sha256_trunc32", config.hash_algorithm);
    EXPECT_EQ("line_attached", config.boundary_rule);
    EXPECT_EQ(8, config.compact_threshold);
    EXPECT_TRUE(config.allow_mode_switch);
    EXPECT_TRUE(config.verbose);
    EXPECT_EQ(5, config.stats_limit);
    EXPECT_TRUE(config.validate().empty());

    auto settings = settingsFromConfig(config);
    EXPECT_EQ("/tmp/forecasts.db", settings.db_path);
    ASSERT_TRUE(settings.hash_algorithm.has_value());
    EXPECT_EQ(HashAlgorithm::Sha256Trunc32, *settings.hash_algorithm);
    ASSERT_TRUE(settings.boundary_rule.has_value());
    EXPECT_EQ(BoundaryRule::LineAttached, *settings.boundary_rule);
    EXPECT_EQ(8u, settings.compact_threshold);
    EXPECT_TRUE(settings.verbose);
}

TEST(DedupConfigTest, AppliesDefaultsForMissingEntries) {
    const std::string yaml = R"(
db_path: "other.db"
)";
    const auto path = writeTempYaml(yaml);
    auto config = loadDedupConfigFromYaml(path);

    EXPECT_EQ("other.db", config.db_path);
    EXPECT_EQ("grow", config.encode_mode);
    EXPECT_TRUE(config.hash_algorithm.empty());
    EXPECT_TRUE(config.boundary_rule.empty());
    EXPECT_EQ(64, config.compact_threshold);
    EXPECT_FALSE(config.allow_mode_switch);
    EXPECT_FALSE(config.verbose);
    EXPECT_EQ(50, config.stats_limit);
}

TEST(DedupConfigTest, UnsetStoreSettingsAreLeftToTheStore) {
    DedupConfig config;
    auto settings = settingsFromConfig(config);
    EXPECT_FALSE(settings.hash_algorithm.has_value());
    EXPECT_FALSE(settings.boundary_rule.has_value());
}

TEST(DedupConfigTest, DefaultsMatchCommandLineDefaults) {
    DedupConfig config;
    EXPECT_EQ("dedupe_main.db", config.db_path);
    EXPECT_TRUE(config.validate().empty());
}

TEST(DedupConfigTest, ValidateReportsEveryProblem) {
    DedupConfig config;
    config.db_path.clear();
    config.encode_mode = "sometimes";
    config.hash_algorithm = "md5";
    config.boundary_rule = "paragraph";
    config.compact_threshold = -1;
    config.stats_limit = 0;

    EXPECT_EQ(6u, config.validate().size());
}

TEST(DedupConfigTest, MissingFileThrows) {
    EXPECT_ANY_THROW(loadDedupConfigFromYaml("/nonexistent/sentence_dedup.yaml"));
}

TEST(DedupConfigTest, CommandLineOverridesYaml) {
    const std::string yaml = R"(
sentence_dedup:
  db_path: "from_yaml.db"
  encode_mode: strict
)";
    CliOptions options;
    options.config_path = writeTempYaml(yaml);
    options.db_path = "from_cli.db";
    options.verbose = true;

    auto setup = buildDedupSetup(options);
    EXPECT_EQ("from_cli.db", setup.config.db_path);
    EXPECT_EQ("from_cli.db", setup.store.db_path);
    EXPECT_EQ(EncodeMode::Strict, setup.encode_mode);
    EXPECT_TRUE(setup.store.verbose);
    EXPECT_TRUE(validateDedupSetup(setup).empty());
}

TEST(DedupConfigTest, ZeroThresholdDisablesCompaction) {
    DedupConfig config;
    config.compact_threshold = 0;
    auto setup = buildDedupSetup(config);
    EXPECT_EQ(0u, setup.store.compact_threshold);
}
