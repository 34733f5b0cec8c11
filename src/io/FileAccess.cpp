// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/io/FileAccess.hpp"

#include <fcntl.h>
#include <glob.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

#include "sentence_dedup/core/DedupError.hpp"

namespace sentence_dedup::io {

std::string readFileBytes(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        throw DedupError(ErrorKind::FileNotFound, "input file does not exist", path);
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw DedupError(ErrorKind::UnreadableInput, "input is not a regular file", path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw DedupError(ErrorKind::UnreadableInput, "failed to open input file", path);
    }

    std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw DedupError(ErrorKind::UnreadableInput, "failed to read input file", path);
    }
    return bytes;
}

std::string makeTemporarySibling(const std::string& path) {
    static std::atomic<uint64_t> counter{0};
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const uint64_t unique_id = counter.fetch_add(1, std::memory_order_relaxed);
    return path + ".tmp_" + std::to_string(::getpid()) + "_" + std::to_string(timestamp) + "_" +
           std::to_string(unique_id);
}

void writeFileAtomically(const std::string& path, const std::string& bytes) {
    const std::string temp_path = makeTemporarySibling(path);

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw DedupError(ErrorKind::WriteFailed,
                         std::string("failed to create output file: ") + std::strerror(errno),
                         path);
    }

    size_t written = 0;
    while (written < bytes.size()) {
        const ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            ::close(fd);
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            throw DedupError(ErrorKind::WriteFailed, "failed to write output file: " + reason, path);
        }
        written += static_cast<size_t>(n);
    }

    if (::fsync(fd) != 0 || ::close(fd) != 0) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        throw DedupError(ErrorKind::WriteFailed, "failed to flush output file", path);
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(temp_path, cleanup_ec);
        throw DedupError(ErrorKind::WriteFailed, "failed to move output into place: " + ec.message(), path);
    }
    syncParentDirectory(path);
}

void syncFile(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw DedupError(ErrorKind::WriteFailed,
                         std::string("failed to open file for sync: ") + std::strerror(errno),
                         path);
    }
    if (::fsync(fd) != 0) {
        const std::string reason = std::strerror(errno);
        ::close(fd);
        throw DedupError(ErrorKind::WriteFailed, "failed to sync file: " + reason, path);
    }
    if (::close(fd) != 0) {
        throw DedupError(ErrorKind::WriteFailed, "failed to close file after sync", path);
    }
}

void syncParentDirectory(const std::string& path) {
    std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        parent = ".";
    }

    int fd = ::open(parent.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        throw DedupError(ErrorKind::WriteFailed,
                         std::string("failed to open directory for sync: ") + std::strerror(errno),
                         parent.string());
    }
    const int status = ::fsync(fd);
    const std::string reason = status != 0 ? std::strerror(errno) : std::string();
    ::close(fd);
    if (status != 0) {
        throw DedupError(ErrorKind::WriteFailed, "failed to sync directory: " + reason, parent.string());
    }
}

std::vector<std::string> expandGlob(const std::string& pattern) {
    std::vector<std::string> files;
    glob_t result;
    std::memset(&result, 0, sizeof(result));

    const int status = ::glob(pattern.c_str(), 0, nullptr, &result);
    if (status == 0) {
        for (size_t i = 0; i < result.gl_pathc; ++i) {
            std::error_code ec;
            if (std::filesystem::is_regular_file(result.gl_pathv[i], ec)) {
                files.emplace_back(result.gl_pathv[i]);
            }
        }
    }
    globfree(&result);

    if (status != 0 && status != GLOB_NOMATCH) {
        std::ostringstream oss;
        oss << "glob expansion failed with status " << status;
        throw DedupError(ErrorKind::UnreadableInput, oss.str(), pattern);
    }

    std::sort(files.begin(), files.end());
    return files;
}

}  // namespace sentence_dedup::io
