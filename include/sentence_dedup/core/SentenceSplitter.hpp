// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_SENTENCE_SPLITTER_HPP
#define SENTENCE_DEDUP_CORE_SENTENCE_SPLITTER_HPP

#include <string>
#include <vector>

#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup {

struct SentenceUnit {
    std::string content;
    Terminator terminator = Terminator::None;

    bool operator==(const SentenceUnit& other) const {
        return content == other.content && terminator == other.terminator;
    }
};

// Splits a byte stream into line units. LF, CRLF and a lone CR all end a
// unit. With BoundaryRule::Line the terminator is kept as a marker beside
// the content; with BoundaryRule::LineAttached it is appended to the content
// and the marker is None. join(split(x)) == x for every input.
class SentenceSplitter {
public:
    explicit SentenceSplitter(BoundaryRule rule = BoundaryRule::LineAttached);

    std::vector<SentenceUnit> split(const std::string& bytes) const;

    static std::string join(const std::vector<SentenceUnit>& units);

    // A unit with no bytes besides its line terminator.
    static bool isBlank(const SentenceUnit& unit);

    BoundaryRule rule() const { return rule_; }

private:
    BoundaryRule rule_;

    void emit(std::vector<SentenceUnit>& units,
              std::string content,
              Terminator terminator) const;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_SENTENCE_SPLITTER_HPP
