// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/StreamDecoder.hpp"

#include <chrono>

#include "sentence_dedup/core/DedupError.hpp"

namespace sentence_dedup {

std::string StreamDecoder::decode(const ReferenceStream& stream, const SentenceDictionary& dictionary) {
    auto t0 = std::chrono::high_resolution_clock::now();
    DecodeStatistics stats;
    std::string out;

    for (size_t index = 0; index < stream.tokens.size(); ++index) {
        const StreamToken& token = stream.tokens[index];
        if (token.kind == TokenKind::Reference) {
            auto bytes = dictionary.get(token.id);
            if (!bytes) {
                throw DedupError(ErrorKind::UnresolvedReference,
                                 "dictionary has no entry for token " + std::to_string(index),
                                 "",
                                 token.id);
            }
            out += *bytes;
            ++stats.references;
        } else {
            out += token.literal;
            ++stats.literals;
        }
        out += terminatorBytes(token.terminator);
    }

    stats.tokens = stream.tokens.size();
    stats.output_bytes = out.size();
    auto t1 = std::chrono::high_resolution_clock::now();
    stats.decode_ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
    last_statistics_ = stats;
    return out;
}

}  // namespace sentence_dedup
