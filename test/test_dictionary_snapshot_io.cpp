// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "sentence_dedup/core/ContentHasher.hpp"
#include "sentence_dedup/io/DictionarySnapshotIO.hpp"

#include <hdf5.h>
#include <hdf5_hl.h>

using namespace sentence_dedup;
using sentence_dedup::io::DictionarySnapshot;
using sentence_dedup::io::DictionarySnapshotIO;

class DictionarySnapshotIOTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file_ = "/tmp/test_sentence_snapshot_" +
                     std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
                     ".db";
    }

    void TearDown() override {
        if (std::filesystem::exists(test_file_)) {
            std::filesystem::remove(test_file_);
        }
    }

    DictionarySnapshot createSnapshot() {
        DictionarySnapshot snapshot;
        snapshot.creation_time = "2025-01-01T00:00:00Z";
        snapshot.hash_algorithm = hasher_.name();
        snapshot.boundary_rule = "line";
        snapshot.encode_mode = "grow";
        snapshot.digest_size = static_cast<uint32_t>(hasher_.digestSize());
        snapshot.last_sequence = 17;

        const std::string texts[] = {"TONIGHT", "TODAY", "Waves 1 ft.", std::string("nul\0inside", 10)};
        SentenceId id = 1;
        for (const auto& text : texts) {
            Sentence sentence;
            sentence.id = id;
            sentence.raw_bytes = text;
            sentence.content_hash = hasher_.hash(text);
            sentence.occurrence_count = id * 10;
            snapshot.entries.push_back(sentence);
            ++id;
        }
        return snapshot;
    }

    std::string test_file_;
    Sha256Hasher hasher_;
};

TEST_F(DictionarySnapshotIOTest, WriteAndReadSnapshot) {
    DictionarySnapshotIO snapshot_io;
    const DictionarySnapshot original = createSnapshot();

    ASSERT_TRUE(snapshot_io.write(test_file_, original)) << snapshot_io.getLastError();
    EXPECT_TRUE(snapshot_io.isValidHDF5(test_file_));

    DictionarySnapshot loaded;
    ASSERT_TRUE(snapshot_io.read(test_file_, loaded)) << snapshot_io.getLastError();

    EXPECT_EQ(original.format_version, loaded.format_version);
    EXPECT_EQ(original.creation_time, loaded.creation_time);
    EXPECT_EQ(original.hash_algorithm, loaded.hash_algorithm);
    EXPECT_EQ(original.boundary_rule, loaded.boundary_rule);
    EXPECT_EQ(original.encode_mode, loaded.encode_mode);
    EXPECT_EQ(original.digest_size, loaded.digest_size);
    EXPECT_EQ(original.last_sequence, loaded.last_sequence);

    ASSERT_EQ(original.entries.size(), loaded.entries.size());
    for (size_t i = 0; i < original.entries.size(); ++i) {
        EXPECT_EQ(original.entries[i].id, loaded.entries[i].id);
        EXPECT_EQ(original.entries[i].raw_bytes, loaded.entries[i].raw_bytes);
        EXPECT_EQ(original.entries[i].content_hash, loaded.entries[i].content_hash);
        EXPECT_EQ(original.entries[i].occurrence_count, loaded.entries[i].occurrence_count);
    }
}

TEST_F(DictionarySnapshotIOTest, EmptyDictionaryAndUnpinnedMode) {
    DictionarySnapshotIO snapshot_io;
    DictionarySnapshot original = createSnapshot();
    original.entries.clear();
    original.encode_mode.clear();

    ASSERT_TRUE(snapshot_io.write(test_file_, original)) << snapshot_io.getLastError();

    DictionarySnapshot loaded;
    ASSERT_TRUE(snapshot_io.read(test_file_, loaded)) << snapshot_io.getLastError();
    EXPECT_TRUE(loaded.entries.empty());
    EXPECT_TRUE(loaded.encode_mode.empty());
    EXPECT_EQ(17u, loaded.last_sequence);
}

TEST_F(DictionarySnapshotIOTest, RejectsHashOfWrongWidth) {
    DictionarySnapshotIO snapshot_io;
    DictionarySnapshot snapshot = createSnapshot();
    snapshot.entries[1].content_hash.resize(4);

    EXPECT_FALSE(snapshot_io.write(test_file_, snapshot));
    EXPECT_FALSE(snapshot_io.getLastError().empty());
    EXPECT_FALSE(std::filesystem::exists(test_file_));
}

TEST_F(DictionarySnapshotIOTest, RejectsMismatchedEntryColumns) {
    DictionarySnapshotIO snapshot_io;
    ASSERT_TRUE(snapshot_io.write(test_file_, createSnapshot())) << snapshot_io.getLastError();

    hid_t file_id = H5Fopen(test_file_.c_str(), H5F_ACC_RDWR, H5P_DEFAULT);
    ASSERT_GE(file_id, 0);
    hid_t entries = H5Gopen2(file_id, "/entries", H5P_DEFAULT);
    ASSERT_GE(entries, 0);
    ASSERT_GE(H5Ldelete(entries, "ids", H5P_DEFAULT), 0);
    const uint64_t short_ids[] = {1, 2};
    hsize_t dims[1] = {2};
    ASSERT_GE(H5LTmake_dataset(entries, "ids", 1, dims, H5T_NATIVE_UINT64, short_ids), 0);
    H5Gclose(entries);
    H5Fclose(file_id);

    DictionarySnapshot loaded;
    EXPECT_FALSE(snapshot_io.read(test_file_, loaded));
    EXPECT_EQ("entry column lengths do not match entry_count", snapshot_io.getLastError());
}

TEST_F(DictionarySnapshotIOTest, MissingOrForeignFileFailsToRead) {
    DictionarySnapshotIO snapshot_io;
    DictionarySnapshot loaded;

    EXPECT_FALSE(snapshot_io.read("/nonexistent/sentence_snapshot.db", loaded));
    EXPECT_FALSE(snapshot_io.getLastError().empty());

    {
        std::ofstream out(test_file_);
        out << "not an hdf5 file";
    }
    EXPECT_FALSE(snapshot_io.isValidHDF5(test_file_));
    EXPECT_FALSE(snapshot_io.read(test_file_, loaded));
}

TEST_F(DictionarySnapshotIOTest, WriteFailsForMissingDirectory) {
    DictionarySnapshotIO snapshot_io;
    EXPECT_FALSE(snapshot_io.write("/nonexistent/dir/snapshot.db", createSnapshot()));
    EXPECT_NE(std::string::npos, snapshot_io.getLastError().find("Directory does not exist"));
}
