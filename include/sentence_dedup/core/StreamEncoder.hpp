// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_STREAM_ENCODER_HPP
#define SENTENCE_DEDUP_CORE_STREAM_ENCODER_HPP

#include <cstddef>
#include <string>

#include "sentence_dedup/core/DedupTypes.hpp"
#include "sentence_dedup/core/ReferenceStream.hpp"
#include "sentence_dedup/core/SentenceDictionary.hpp"
#include "sentence_dedup/core/SentenceSplitter.hpp"

namespace sentence_dedup {

struct EncodeStatistics {
    size_t units = 0;
    size_t references = 0;
    size_t literals = 0;
    size_t blank_units = 0;
    size_t new_entries = 0;
    size_t input_bytes = 0;
    double encode_ms = 0.0;
};

// Turns a file's bytes into a reference stream.
//
// Blank units are always literals and never reach the dictionary. Other
// units that the dictionary knows become references. Unknown units are
// inserted in Grow mode and kept as literals in Strict mode; Strict never
// mutates the dictionary.
class StreamEncoder {
public:
    explicit StreamEncoder(BoundaryRule rule = BoundaryRule::LineAttached);

    ReferenceStream encode(const std::string& bytes, SentenceDictionary& dictionary, EncodeMode mode);
    ReferenceStream encodeStrict(const std::string& bytes, const SentenceDictionary& dictionary);

    const EncodeStatistics& getLastStatistics() const { return last_statistics_; }

private:
    SentenceSplitter splitter_;
    EncodeStatistics last_statistics_;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_STREAM_ENCODER_HPP
