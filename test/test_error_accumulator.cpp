// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include "sentence_dedup/utils/ErrorAccumulator.hpp"

using sentence_dedup::DedupError;
using sentence_dedup::ErrorKind;
using sentence_dedup::utils::ErrorAccumulator;

TEST(ErrorAccumulatorTest, StartsEmpty) {
    ErrorAccumulator acc;
    EXPECT_TRUE(acc.empty());
    EXPECT_TRUE(acc.str().empty());
    EXPECT_EQ(0u, acc.count());
    EXPECT_EQ(ErrorKind::None, acc.firstKind());
}

TEST(ErrorAccumulatorTest, AddsMessagesWithDelimiter) {
    ErrorAccumulator acc;
    acc.add("first");
    acc.add("");
    acc.add("second");

    EXPECT_FALSE(acc.empty());
    EXPECT_EQ("first; second", acc.str());
    EXPECT_EQ(2u, acc.count());
}

TEST(ErrorAccumulatorTest, KeepsKindOfFirstError) {
    ErrorAccumulator acc;
    acc.add(DedupError(ErrorKind::FileNotFound, "input file does not exist", "a.txt"));
    acc.add(DedupError(ErrorKind::UnreadableInput, "input is not a regular file", "dir"));

    EXPECT_EQ(ErrorKind::FileNotFound, acc.firstKind());
    EXPECT_EQ(2u, acc.count());
    EXPECT_EQ("FileNotFound: input file does not exist [a.txt]; "
              "UnreadableInput: input is not a regular file [dir]",
              acc.str());
}

TEST(ErrorAccumulatorTest, ClearsMessages) {
    ErrorAccumulator acc;
    acc.add(DedupError(ErrorKind::WriteFailed, "disk full"));
    acc.clear();
    EXPECT_TRUE(acc.empty());
    EXPECT_TRUE(acc.str().empty());
    EXPECT_EQ(ErrorKind::None, acc.firstKind());
}
