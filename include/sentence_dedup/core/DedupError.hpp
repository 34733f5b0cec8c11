// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_CORE_DEDUP_ERROR_HPP
#define SENTENCE_DEDUP_CORE_DEDUP_ERROR_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace sentence_dedup {

enum class ErrorKind {
    None,
    FileNotFound,
    UnreadableInput,
    UnresolvedReference,
    DatabaseCorruption,
    MalformedStream,
    ConfigMismatch,
    LockFailed,
    WriteFailed,
};

const char* errorKindName(ErrorKind kind);

// Error raised by the dictionary core. what() carries the kind, the
// offending path and id (when known) so callers can report it verbatim.
class DedupError : public std::runtime_error {
public:
    DedupError(ErrorKind kind,
               const std::string& message,
               const std::string& path = "",
               std::optional<uint64_t> id = std::nullopt);

    ErrorKind kind() const { return kind_; }
    const std::string& path() const { return path_; }
    std::optional<uint64_t> id() const { return id_; }
    const std::string& detail() const { return detail_; }

private:
    ErrorKind kind_;
    std::string path_;
    std::optional<uint64_t> id_;
    std::string detail_;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_CORE_DEDUP_ERROR_HPP
