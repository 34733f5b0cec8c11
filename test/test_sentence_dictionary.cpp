// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/core/DedupError.hpp"
#include "sentence_dedup/core/SentenceDictionary.hpp"

using namespace sentence_dedup;

namespace {

// Maps every input to the same digest so every insert lands in one bucket.
class ConstantHasher : public ContentHasher {
public:
    std::string name() const override { return "constant"; }
    size_t digestSize() const override { return 1; }
    ContentHash hash(const std::string&) const override { return ContentHash(1, '\x2a'); }
};

Sentence makeSentence(const ContentHasher& hasher, SentenceId id, const std::string& bytes, uint64_t count = 1) {
    Sentence sentence;
    sentence.id = id;
    sentence.raw_bytes = bytes;
    sentence.content_hash = hasher.hash(bytes);
    sentence.occurrence_count = count;
    return sentence;
}

}  // namespace

class SentenceDictionaryTest : public ::testing::Test {
protected:
    std::shared_ptr<const ContentHasher> hasher_ = makeContentHasher(HashAlgorithm::Sha256);
};

TEST_F(SentenceDictionaryTest, AssignsSequentialIdsFromOne) {
    SentenceDictionary dictionary(hasher_);

    auto first = dictionary.insertOrGet("TONIGHT");
    auto second = dictionary.insertOrGet("TODAY");

    EXPECT_TRUE(first.inserted);
    EXPECT_TRUE(second.inserted);
    EXPECT_EQ(1u, first.id);
    EXPECT_EQ(2u, second.id);
    EXPECT_EQ(2u, dictionary.size());
    EXPECT_EQ(2u, dictionary.maxId());
}

TEST_F(SentenceDictionaryTest, ReusesIdForIdenticalBytesAndCounts) {
    SentenceDictionary dictionary(hasher_);

    auto first = dictionary.insertOrGet("Waves 1 ft.");
    auto again = dictionary.insertOrGet("Waves 1 ft.");

    EXPECT_FALSE(again.inserted);
    EXPECT_EQ(first.id, again.id);
    EXPECT_EQ(1u, dictionary.size());
    ASSERT_TRUE(dictionary.entry(first.id).has_value());
    EXPECT_EQ(2u, dictionary.entry(first.id)->occurrence_count);
    EXPECT_EQ(2u, dictionary.totalOccurrences());
}

TEST_F(SentenceDictionaryTest, LookupAndGetDoNotMutate) {
    SentenceDictionary dictionary(hasher_);
    auto inserted = dictionary.insertOrGet("abc");

    EXPECT_EQ(inserted.id, dictionary.lookup("abc"));
    EXPECT_FALSE(dictionary.lookup("abd").has_value());
    EXPECT_EQ(std::string("abc"), dictionary.get(inserted.id));
    EXPECT_FALSE(dictionary.get(99).has_value());
    EXPECT_EQ(1u, dictionary.entry(inserted.id)->occurrence_count);
}

TEST_F(SentenceDictionaryTest, ContentIsComparedByteForByte) {
    SentenceDictionary dictionary(hasher_);

    auto plain = dictionary.insertOrGet("Wind 10 kt");
    auto trailing_space = dictionary.insertOrGet("Wind 10 kt ");
    auto upper = dictionary.insertOrGet("WIND 10 KT");

    EXPECT_NE(plain.id, trailing_space.id);
    EXPECT_NE(plain.id, upper.id);
    EXPECT_EQ(3u, dictionary.size());
}

TEST_F(SentenceDictionaryTest, CollidingHashesGetDistinctIds) {
    SentenceDictionary dictionary(std::make_shared<ConstantHasher>());

    auto a = dictionary.insertOrGet("alpha");
    auto b = dictionary.insertOrGet("beta");
    auto a_again = dictionary.insertOrGet("alpha");

    EXPECT_NE(a.id, b.id);
    EXPECT_EQ(a.id, a_again.id);
    EXPECT_EQ(1u, dictionary.bucketCount());
    EXPECT_EQ(1u, dictionary.collisionCount());
    EXPECT_EQ(std::string("alpha"), dictionary.get(a.id));
    EXPECT_EQ(std::string("beta"), dictionary.get(b.id));
    EXPECT_EQ(b.id, dictionary.lookup("beta"));
    EXPECT_FALSE(dictionary.lookup("gamma").has_value());
}

TEST_F(SentenceDictionaryTest, ConcurrentInsertsOfSameBytesYieldOneId) {
    SentenceDictionary dictionary(hasher_);
    constexpr int kThreads = 8;
    constexpr int kIterations = 200;

    std::vector<std::vector<SentenceId>> seen(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&dictionary, &seen, t]() {
            for (int i = 0; i < kIterations; ++i) {
                seen[t].push_back(dictionary.insertOrGet("shared sentence").id);
                dictionary.insertOrGet("thread " + std::to_string(t));
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const SentenceId expected = *dictionary.lookup("shared sentence");
    for (const auto& ids : seen) {
        for (SentenceId id : ids) {
            EXPECT_EQ(expected, id);
        }
    }
    EXPECT_EQ(static_cast<size_t>(kThreads + 1), dictionary.size());
    EXPECT_EQ(static_cast<uint64_t>(kThreads * kIterations),
              dictionary.entry(expected)->occurrence_count);
}

TEST_F(SentenceDictionaryTest, RecordOccurrenceRejectsUnknownId) {
    SentenceDictionary dictionary(hasher_);
    auto inserted = dictionary.insertOrGet("x");

    EXPECT_TRUE(dictionary.recordOccurrence(inserted.id));
    EXPECT_FALSE(dictionary.recordOccurrence(inserted.id + 1));
    EXPECT_EQ(2u, dictionary.entry(inserted.id)->occurrence_count);
}

TEST_F(SentenceDictionaryTest, PendingChangesSeparateNewEntriesFromDeltas) {
    SentenceDictionary dictionary(hasher_);
    dictionary.insertOrGet("committed");
    dictionary.markCommitted();
    EXPECT_FALSE(dictionary.hasPendingChanges());

    dictionary.insertOrGet("committed");
    dictionary.insertOrGet("committed");
    dictionary.insertOrGet("fresh");
    dictionary.insertOrGet("fresh");

    PendingChanges changes = dictionary.pendingChanges();
    ASSERT_EQ(1u, changes.new_entries.size());
    EXPECT_EQ("fresh", changes.new_entries[0].raw_bytes);
    EXPECT_EQ(2u, changes.new_entries[0].occurrence_count);
    ASSERT_EQ(1u, changes.count_deltas.size());
    EXPECT_EQ(1u, changes.count_deltas[0].first);
    EXPECT_EQ(2u, changes.count_deltas[0].second);
}

TEST_F(SentenceDictionaryTest, DiscardPendingRestoresCommittedState) {
    SentenceDictionary dictionary(hasher_);
    dictionary.insertOrGet("kept");
    dictionary.markCommitted();

    dictionary.insertOrGet("kept");
    dictionary.insertOrGet("dropped");
    dictionary.discardPending();

    EXPECT_EQ(1u, dictionary.size());
    EXPECT_EQ(1u, dictionary.maxId());
    EXPECT_EQ(1u, dictionary.totalOccurrences());
    EXPECT_FALSE(dictionary.lookup("dropped").has_value());
    EXPECT_FALSE(dictionary.hasPendingChanges());

    // The discarded id is handed out again.
    EXPECT_EQ(2u, dictionary.insertOrGet("other").id);
}

TEST_F(SentenceDictionaryTest, RestoreEntryRebuildsState) {
    SentenceDictionary dictionary(hasher_);
    dictionary.restoreEntry(makeSentence(*hasher_, 1, "one", 3));
    dictionary.restoreEntry(makeSentence(*hasher_, 2, "two", 1));
    dictionary.restoreOccurrences(1, 2);

    EXPECT_EQ(2u, dictionary.size());
    EXPECT_EQ(5u, dictionary.entry(1)->occurrence_count);
    EXPECT_EQ(6u, dictionary.totalOccurrences());
    EXPECT_FALSE(dictionary.hasPendingChanges());
    EXPECT_EQ(3u, dictionary.insertOrGet("three").id);
}

TEST_F(SentenceDictionaryTest, RestoreEntryRejectsGapInIds) {
    SentenceDictionary dictionary(hasher_);
    try {
        dictionary.restoreEntry(makeSentence(*hasher_, 2, "two"));
        FAIL() << "expected DedupError";
    } catch (const DedupError& e) {
        EXPECT_EQ(ErrorKind::DatabaseCorruption, e.kind());
        ASSERT_TRUE(e.id().has_value());
        EXPECT_EQ(2u, *e.id());
    }
}

TEST_F(SentenceDictionaryTest, RestoreEntryRejectsHashMismatch) {
    SentenceDictionary dictionary(hasher_);
    Sentence sentence = makeSentence(*hasher_, 1, "one");
    sentence.raw_bytes = "0ne";
    EXPECT_THROW(dictionary.restoreEntry(sentence), DedupError);
}

TEST_F(SentenceDictionaryTest, RestoreEntryRejectsDuplicateContent) {
    SentenceDictionary dictionary(hasher_);
    dictionary.restoreEntry(makeSentence(*hasher_, 1, "same"));
    EXPECT_THROW(dictionary.restoreEntry(makeSentence(*hasher_, 2, "same")), DedupError);
}

TEST_F(SentenceDictionaryTest, RestoreOccurrencesRejectsUnknownId) {
    SentenceDictionary dictionary(hasher_);
    EXPECT_THROW(dictionary.restoreOccurrences(7, 1), DedupError);
}
