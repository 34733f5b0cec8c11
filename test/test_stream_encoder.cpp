// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <string>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/core/SentenceDictionary.hpp"
#include "sentence_dedup/core/StreamEncoder.hpp"

using namespace sentence_dedup;

class StreamEncoderTest : public ::testing::Test {
protected:
    SentenceDictionary dictionary_{makeContentHasher(HashAlgorithm::Sha256)};
};

TEST_F(StreamEncoderTest, SeededForecastBecomesReferences) {
    dictionary_.insertOrGet("TONIGHT");
    dictionary_.insertOrGet("TODAY");
    dictionary_.insertOrGet("Waves 1 ft.");
    dictionary_.markCommitted();

    StreamEncoder encoder(BoundaryRule::Line);
    ReferenceStream stream = encoder.encode("TONIGHT\nTODAY\nWaves 1 ft.\n", dictionary_, EncodeMode::Grow);

    ASSERT_EQ(3u, stream.tokens.size());
    EXPECT_TRUE(stream.tokens[0] == StreamToken::reference(1, Terminator::LF));
    EXPECT_TRUE(stream.tokens[1] == StreamToken::reference(2, Terminator::LF));
    EXPECT_TRUE(stream.tokens[2] == StreamToken::reference(3, Terminator::LF));
    EXPECT_EQ(EncodeMode::Grow, stream.header.mode);

    const auto& stats = encoder.getLastStatistics();
    EXPECT_EQ(3u, stats.references);
    EXPECT_EQ(0u, stats.new_entries);
    EXPECT_EQ(2u, dictionary_.entry(1)->occurrence_count);
}

TEST_F(StreamEncoderTest, GrowModeAddsUnknownSentences) {
    StreamEncoder encoder;
    ReferenceStream stream = encoder.encode("a\nb\na\n", dictionary_, EncodeMode::Grow);

    ASSERT_EQ(3u, stream.tokens.size());
    EXPECT_EQ(TokenKind::Reference, stream.tokens[0].kind);
    EXPECT_EQ(stream.tokens[0].id, stream.tokens[2].id);
    EXPECT_NE(stream.tokens[0].id, stream.tokens[1].id);
    EXPECT_EQ(2u, dictionary_.size());
    EXPECT_EQ(2u, encoder.getLastStatistics().new_entries);
    EXPECT_EQ(2u, dictionary_.entry(stream.tokens[0].id)->occurrence_count);
}

TEST_F(StreamEncoderTest, StrictModeKeepsUnknownSentencesAsLiterals) {
    dictionary_.insertOrGet("known");
    dictionary_.markCommitted();

    StreamEncoder encoder(BoundaryRule::Line);
    ReferenceStream stream = encoder.encode("known\nunknown", dictionary_, EncodeMode::Strict);

    ASSERT_EQ(2u, stream.tokens.size());
    EXPECT_TRUE(stream.tokens[0] == StreamToken::reference(1, Terminator::LF));
    EXPECT_TRUE(stream.tokens[1] == StreamToken::literalBytes("unknown", Terminator::None));
    EXPECT_EQ(EncodeMode::Strict, stream.header.mode);

    EXPECT_EQ(1u, dictionary_.size());
    EXPECT_EQ(1u, dictionary_.entry(1)->occurrence_count);
    EXPECT_FALSE(dictionary_.hasPendingChanges());
}

TEST_F(StreamEncoderTest, BlankLinesAreLiteralsAndNeverStored) {
    StreamEncoder encoder(BoundaryRule::Line);
    ReferenceStream stream = encoder.encode("x\n\n\r\n", dictionary_, EncodeMode::Grow);

    ASSERT_EQ(3u, stream.tokens.size());
    EXPECT_TRUE(stream.tokens[1] == StreamToken::literalBytes("", Terminator::LF));
    EXPECT_TRUE(stream.tokens[2] == StreamToken::literalBytes("", Terminator::CRLF));
    EXPECT_EQ(1u, dictionary_.size());
    EXPECT_FALSE(dictionary_.lookup("").has_value());
    EXPECT_EQ(2u, encoder.getLastStatistics().blank_units);
}

TEST_F(StreamEncoderTest, AttachedRuleStoresTerminatorWithContent) {
    StreamEncoder encoder(BoundaryRule::LineAttached);
    ReferenceStream stream = encoder.encode("s\ns\r\n", dictionary_, EncodeMode::Grow);

    ASSERT_EQ(2u, stream.tokens.size());
    EXPECT_NE(stream.tokens[0].id, stream.tokens[1].id);
    EXPECT_EQ(Terminator::None, stream.tokens[0].terminator);
    EXPECT_EQ(std::string("s\r\n"), dictionary_.get(stream.tokens[1].id));
    EXPECT_EQ(BoundaryRule::LineAttached, stream.header.boundary_rule);
}

TEST_F(StreamEncoderTest, EmptyInputProducesEmptyStream) {
    StreamEncoder encoder;
    ReferenceStream stream = encoder.encode("", dictionary_, EncodeMode::Grow);
    EXPECT_TRUE(stream.tokens.empty());
    EXPECT_EQ(0u, dictionary_.size());
}
