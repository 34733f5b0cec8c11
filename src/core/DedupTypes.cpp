// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup {

const char* terminatorBytes(Terminator terminator) {
    switch (terminator) {
        case Terminator::LF:
            return "\n";
        case Terminator::CRLF:
            return "\r\n";
        case Terminator::CR:
            return "\r";
        case Terminator::None:
        default:
            return "";
    }
}

std::string toString(BoundaryRule rule) {
    return rule == BoundaryRule::LineAttached ? "line_attached" : "line";
}

std::string toString(EncodeMode mode) {
    return mode == EncodeMode::Strict ? "strict" : "grow";
}

std::optional<BoundaryRule> parseBoundaryRule(const std::string& value) {
    if (value == "line") {
        return BoundaryRule::Line;
    }
    if (value == "line_attached") {
        return BoundaryRule::LineAttached;
    }
    return std::nullopt;
}

std::optional<EncodeMode> parseEncodeMode(const std::string& value) {
    if (value == "grow") {
        return EncodeMode::Grow;
    }
    if (value == "strict") {
        return EncodeMode::Strict;
    }
    return std::nullopt;
}

}  // namespace sentence_dedup
