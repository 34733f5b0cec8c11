// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_STREAM_DECODER_HPP
#define SENTENCE_DEDUP_CORE_STREAM_DECODER_HPP

#include <cstddef>
#include <string>

#include "sentence_dedup/core/ReferenceStream.hpp"
#include "sentence_dedup/core/SentenceDictionary.hpp"

namespace sentence_dedup {

struct DecodeStatistics {
    size_t tokens = 0;
    size_t references = 0;
    size_t literals = 0;
    size_t output_bytes = 0;
    double decode_ms = 0.0;
};

class StreamDecoder {
public:
    // Renders the whole stream into memory. Throws
    // DedupError(UnresolvedReference) naming the id and token index when the
    // dictionary lacks an id; nothing is returned in that case.
    std::string decode(const ReferenceStream& stream, const SentenceDictionary& dictionary);

    const DecodeStatistics& getLastStatistics() const { return last_statistics_; }

private:
    DecodeStatistics last_statistics_;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_STREAM_DECODER_HPP
