// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/DedupError.hpp"

#include <sstream>

namespace sentence_dedup {

namespace {

std::string composeMessage(ErrorKind kind,
                           const std::string& message,
                           const std::string& path,
                           std::optional<uint64_t> id) {
    std::ostringstream oss;
    oss << errorKindName(kind) << ": " << message;
    if (id) {
        oss << " (id=" << *id << ")";
    }
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    return oss.str();
}

}

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "None";
        case ErrorKind::FileNotFound:
            return "FileNotFound";
        case ErrorKind::UnreadableInput:
            return "UnreadableInput";
        case ErrorKind::UnresolvedReference:
            return "UnresolvedReference";
        case ErrorKind::DatabaseCorruption:
            return "DatabaseCorruption";
        case ErrorKind::MalformedStream:
            return "MalformedStream";
        case ErrorKind::ConfigMismatch:
            return "ConfigMismatch";
        case ErrorKind::LockFailed:
            return "LockFailed";
        case ErrorKind::WriteFailed:
            return "WriteFailed";
    }
    return "Unknown";
}

DedupError::DedupError(ErrorKind kind,
                       const std::string& message,
                       const std::string& path,
                       std::optional<uint64_t> id)
    : std::runtime_error(composeMessage(kind, message, path, id)),
      kind_(kind),
      path_(path),
      id_(id),
      detail_(message) {}

}  // namespace sentence_dedup
