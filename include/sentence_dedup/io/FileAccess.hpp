// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_IO_FILE_ACCESS_HPP
#define SENTENCE_DEDUP_IO_FILE_ACCESS_HPP

#include <string>
#include <vector>

namespace sentence_dedup::io {

// Reads a whole file in binary mode. Throws DedupError(FileNotFound) when the
// path does not exist and DedupError(UnreadableInput) when it is not a
// regular file or the read fails.
std::string readFileBytes(const std::string& path);

// Writes to a unique sibling temporary file, flushes it to disk and renames it
// over path, then syncs the directory entry. Throws DedupError(WriteFailed).
void writeFileAtomically(const std::string& path, const std::string& bytes);

// fsync an existing file, or the directory holding path. Both throw
// DedupError(WriteFailed).
void syncFile(const std::string& path);
void syncParentDirectory(const std::string& path);

std::string makeTemporarySibling(const std::string& path);

// POSIX glob expansion, sorted, regular files only.
std::vector<std::string> expandGlob(const std::string& pattern);

}  // namespace sentence_dedup::io

#endif  // SENTENCE_DEDUP_IO_FILE_ACCESS_HPP
