// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/StreamEncoder.hpp"

#include <chrono>

namespace sentence_dedup {

StreamEncoder::StreamEncoder(BoundaryRule rule) : splitter_(rule) {}

ReferenceStream StreamEncoder::encode(const std::string& bytes,
                                      SentenceDictionary& dictionary,
                                      EncodeMode mode) {
    if (mode == EncodeMode::Strict) {
        return encodeStrict(bytes, dictionary);
    }

    auto t0 = std::chrono::high_resolution_clock::now();
    EncodeStatistics stats;
    stats.input_bytes = bytes.size();

    ReferenceStream stream;
    stream.header.mode = EncodeMode::Grow;
    stream.header.boundary_rule = splitter_.rule();

    for (auto& unit : splitter_.split(bytes)) {
        ++stats.units;
        if (SentenceSplitter::isBlank(unit)) {
            ++stats.blank_units;
            ++stats.literals;
            stream.tokens.push_back(StreamToken::literalBytes(std::move(unit.content), unit.terminator));
            continue;
        }

        SentenceId id = 0;
        if (auto existing = dictionary.lookup(unit.content)) {
            id = *existing;
            dictionary.recordOccurrence(id);
        } else {
            const InsertResult result = dictionary.insertOrGet(unit.content);
            id = result.id;
            if (result.inserted) {
                ++stats.new_entries;
            }
        }
        ++stats.references;
        stream.tokens.push_back(StreamToken::reference(id, unit.terminator));
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    stats.encode_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    last_statistics_ = stats;
    return stream;
}

ReferenceStream StreamEncoder::encodeStrict(const std::string& bytes, const SentenceDictionary& dictionary) {
    auto t0 = std::chrono::high_resolution_clock::now();
    EncodeStatistics stats;
    stats.input_bytes = bytes.size();

    ReferenceStream stream;
    stream.header.mode = EncodeMode::Strict;
    stream.header.boundary_rule = splitter_.rule();

    for (auto& unit : splitter_.split(bytes)) {
        ++stats.units;
        if (SentenceSplitter::isBlank(unit)) {
            ++stats.blank_units;
        } else if (auto id = dictionary.lookup(unit.content)) {
            ++stats.references;
            stream.tokens.push_back(StreamToken::reference(*id, unit.terminator));
            continue;
        }
        ++stats.literals;
        stream.tokens.push_back(StreamToken::literalBytes(std::move(unit.content), unit.terminator));
    }

    auto t1 = std::chrono::high_resolution_clock::now();
    stats.encode_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    last_statistics_ = stats;
    return stream;
}

}  // namespace sentence_dedup
