// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_STORE_FILE_LOCK_HPP
#define SENTENCE_DEDUP_STORE_FILE_LOCK_HPP

#include <string>

namespace sentence_dedup {

enum class LockMode {
    Shared,
    Exclusive,
};

// Advisory flock(2) on a sidecar file, held for the lifetime of the object.
// Blocks until the lock is granted. Throws DedupError(LockFailed).
class FileLock {
public:
    FileLock(const std::string& path, LockMode mode);
    ~FileLock();

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

    const std::string& path() const { return path_; }
    LockMode mode() const { return mode_; }

private:
    std::string path_;
    LockMode mode_;
    int fd_ = -1;
};

}  // namespace sentence_dedup

#endif  // SENTENCE_DEDUP_STORE_FILE_LOCK_HPP
