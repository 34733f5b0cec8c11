// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/SentenceSplitter.hpp"

#include <utility>

namespace sentence_dedup {

SentenceSplitter::SentenceSplitter(BoundaryRule rule) : rule_(rule) {}

std::vector<SentenceUnit> SentenceSplitter::split(const std::string& bytes) const {
    std::vector<SentenceUnit> units;
    const size_t size = bytes.size();
    size_t start = 0;
    size_t pos = 0;

    while (pos < size) {
        const char c = bytes[pos];
        Terminator terminator = Terminator::None;
        size_t terminator_length = 0;

        if (c == '\n') {
            terminator = Terminator::LF;
            terminator_length = 1;
        } else if (c == '\r') {
            if (pos + 1 < size && bytes[pos + 1] == '\n') {
                terminator = Terminator::CRLF;
                terminator_length = 2;
            } else {
                terminator = Terminator::CR;
                terminator_length = 1;
            }
        } else {
            ++pos;
            continue;
        }

        emit(units, bytes.substr(start, pos - start), terminator);
        pos += terminator_length;
        start = pos;
    }

    // Trailing bytes without a terminator form the last unit.
    if (start < size) {
        emit(units, bytes.substr(start), Terminator::None);
    }
    return units;
}

std::string SentenceSplitter::join(const std::vector<SentenceUnit>& units) {
    std::string out;
    for (const auto& unit : units) {
        out += unit.content;
        out += terminatorBytes(unit.terminator);
    }
    return out;
}

bool SentenceSplitter::isBlank(const SentenceUnit& unit) {
    return unit.content.empty() || unit.content == "\n" || unit.content == "\r\n" ||
           unit.content == "\r";
}

void SentenceSplitter::emit(std::vector<SentenceUnit>& units,
                            std::string content,
                            Terminator terminator) const {
    SentenceUnit unit;
    if (rule_ == BoundaryRule::LineAttached) {
        content += terminatorBytes(terminator);
        unit.terminator = Terminator::None;
    } else {
        unit.terminator = terminator;
    }
    unit.content = std::move(content);
    units.push_back(std::move(unit));
}

}  // namespace sentence_dedup
