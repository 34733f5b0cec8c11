// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/store/FileLock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "sentence_dedup/core/DedupError.hpp"

namespace sentence_dedup {

FileLock::FileLock(const std::string& path, LockMode mode)
    : path_(path), mode_(mode) {
    fd_ = ::open(path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw DedupError(ErrorKind::LockFailed,
                         std::string("failed to open lock file: ") + std::strerror(errno),
                         path_);
    }

    const int operation = (mode_ == LockMode::Exclusive) ? LOCK_EX : LOCK_SH;
    int rc = 0;
    do {
        rc = ::flock(fd_, operation);
    } while (rc != 0 && errno == EINTR);

    if (rc != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd_);
        fd_ = -1;
        throw DedupError(ErrorKind::LockFailed, "failed to acquire lock: " + reason, path_);
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

}  // namespace sentence_dedup
