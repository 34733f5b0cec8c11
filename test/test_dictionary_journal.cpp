// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/core/DedupError.hpp"
#include "sentence_dedup/store/DictionaryJournal.hpp"

using namespace sentence_dedup;
namespace fs = std::filesystem;

class DictionaryJournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        journal_path_ = (fs::temp_directory_path() /
                         ("sentence_dedup_journal_" +
                          std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
                          ".journal"))
                            .string();
    }

    void TearDown() override {
        if (fs::exists(journal_path_)) {
            fs::remove(journal_path_);
        }
    }

    JournalBatch makeBatch(uint64_t sequence, const std::string& text) {
        JournalBatch batch;
        batch.sequence = sequence;
        Sentence sentence;
        sentence.id = sequence;
        sentence.raw_bytes = text;
        sentence.content_hash = hasher_.hash(text);
        sentence.occurrence_count = 1;
        batch.new_entries.push_back(sentence);
        return batch;
    }

    std::string readAll() {
        std::ifstream in(journal_path_, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    void writeAll(const std::string& bytes) {
        std::ofstream out(journal_path_, std::ios::binary | std::ios::trunc);
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }

    std::string journal_path_;
    Sha256Hasher hasher_;
};

TEST_F(DictionaryJournalTest, MissingJournalReadsEmpty) {
    DictionaryJournal journal(journal_path_);
    EXPECT_FALSE(journal.exists());
    JournalReadResult result = journal.read();
    EXPECT_TRUE(result.batches.empty());
    EXPECT_FALSE(result.torn_tail);
}

TEST_F(DictionaryJournalTest, AppendedBatchesReadBackInOrder) {
    {
        DictionaryJournal journal(journal_path_);
        JournalBatch first = makeBatch(1, "TONIGHT");
        first.pins.push_back({"hash_algorithm", "sha256"});
        journal.append(first);

        JournalBatch second = makeBatch(2, "TODAY");
        second.count_deltas.emplace_back(1, 4);
        journal.append(second);
        EXPECT_EQ(2u, journal.batchCount());
    }

    DictionaryJournal reopened(journal_path_);
    JournalReadResult result = reopened.read();
    ASSERT_EQ(2u, result.batches.size());
    EXPECT_FALSE(result.torn_tail);
    EXPECT_EQ(result.file_length, result.valid_length);

    const JournalBatch& first = result.batches[0];
    EXPECT_EQ(1u, first.sequence);
    ASSERT_EQ(1u, first.pins.size());
    EXPECT_EQ("hash_algorithm", first.pins[0].key);
    EXPECT_EQ("sha256", first.pins[0].value);
    ASSERT_EQ(1u, first.new_entries.size());
    EXPECT_EQ("TONIGHT", first.new_entries[0].raw_bytes);
    EXPECT_EQ(hasher_.hash("TONIGHT"), first.new_entries[0].content_hash);

    const JournalBatch& second = result.batches[1];
    ASSERT_EQ(1u, second.count_deltas.size());
    EXPECT_EQ(1u, second.count_deltas[0].first);
    EXPECT_EQ(4u, second.count_deltas[0].second);
}

TEST_F(DictionaryJournalTest, TornTailIsIgnoredAndCutOnNextAppend) {
    {
        DictionaryJournal journal(journal_path_);
        journal.append(makeBatch(1, "kept"));
    }
    const std::string intact = readAll();

    // Half of a second batch, as left by a crash mid-write.
    std::string torn = DictionaryJournal::encodePayload(makeBatch(2, "lost"));
    writeAll(intact + std::string("BTCH", 4) + torn.substr(0, 5));

    DictionaryJournal journal(journal_path_);
    JournalReadResult result = journal.read();
    ASSERT_EQ(1u, result.batches.size());
    EXPECT_TRUE(result.torn_tail);
    EXPECT_EQ(intact.size(), result.valid_length);

    journal.append(makeBatch(2, "next"));

    DictionaryJournal reopened(journal_path_);
    JournalReadResult after = reopened.read();
    ASSERT_EQ(2u, after.batches.size());
    EXPECT_FALSE(after.torn_tail);
    EXPECT_EQ("next", after.batches[1].new_entries[0].raw_bytes);
}

TEST_F(DictionaryJournalTest, DigestFailureOnLastBatchIsTornTail) {
    {
        DictionaryJournal journal(journal_path_);
        journal.append(makeBatch(1, "first"));
        journal.append(makeBatch(2, "second"));
    }
    std::string bytes = readAll();
    bytes[bytes.size() - 1] ^= 0x01;
    writeAll(bytes);

    DictionaryJournal journal(journal_path_);
    JournalReadResult result = journal.read();
    EXPECT_TRUE(result.torn_tail);
    ASSERT_EQ(1u, result.batches.size());
    EXPECT_EQ(1u, result.batches[0].sequence);
}

TEST_F(DictionaryJournalTest, DigestFailureInsideJournalIsCorruption) {
    {
        DictionaryJournal journal(journal_path_);
        journal.append(makeBatch(1, "first"));
        journal.append(makeBatch(2, "second"));
    }
    std::string bytes = readAll();
    // First payload byte: after the 8-byte file header and 20-byte batch header.
    bytes[28] ^= 0x01;
    writeAll(bytes);

    DictionaryJournal journal(journal_path_);
    try {
        journal.read();
        FAIL() << "expected DedupError";
    } catch (const DedupError& e) {
        EXPECT_EQ(ErrorKind::DatabaseCorruption, e.kind());
        EXPECT_EQ(journal_path_, e.path());
    }
}

TEST_F(DictionaryJournalTest, NonIncreasingSequenceIsCorruption) {
    {
        DictionaryJournal journal(journal_path_);
        journal.append(makeBatch(2, "first"));
        journal.append(makeBatch(2, "second"));
    }

    DictionaryJournal journal(journal_path_);
    EXPECT_THROW(journal.read(), DedupError);
}

TEST_F(DictionaryJournalTest, BadMagicIsCorruption) {
    writeAll(std::string("NOPE\x01\x00\x00\x00", 8));
    DictionaryJournal journal(journal_path_);
    EXPECT_THROW(journal.read(), DedupError);
}

TEST_F(DictionaryJournalTest, ResetLeavesEmptyJournal) {
    DictionaryJournal journal(journal_path_);
    journal.append(makeBatch(1, "gone"));
    journal.reset();
    EXPECT_EQ(0u, journal.batchCount());

    DictionaryJournal reopened(journal_path_);
    JournalReadResult result = reopened.read();
    EXPECT_TRUE(result.batches.empty());
    EXPECT_FALSE(result.torn_tail);
    EXPECT_EQ(8u, result.file_length);

    journal.append(makeBatch(5, "after reset"));
    ASSERT_EQ(1u, DictionaryJournal(journal_path_).read().batches.size());
}
