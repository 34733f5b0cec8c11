// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_UTILS_ERROR_ACCUMULATOR_HPP
#define SENTENCE_DEDUP_UTILS_ERROR_ACCUMULATOR_HPP

#include <cstddef>
#include <string>

#include "sentence_dedup/core/DedupError.hpp"

namespace sentence_dedup::utils {

// Collects per-file failures so a batch can report all of them at once.
// The kind of the first failure is kept for the exit status.
class ErrorAccumulator {
public:
    void add(const std::string& message) {
        if (message.empty()) {
            return;
        }
        if (!messages_.empty()) {
            messages_ += "; ";
        }
        messages_ += message;
        ++count_;
    }

    void add(const DedupError& error) {
        if (first_kind_ == ErrorKind::None) {
            first_kind_ = error.kind();
        }
        add(std::string(error.what()));
    }

    bool empty() const {
        return messages_.empty();
    }

    const std::string& str() const {
        return messages_;
    }

    size_t count() const { return count_; }
    ErrorKind firstKind() const { return first_kind_; }

    void clear() {
        messages_.clear();
        count_ = 0;
        first_kind_ = ErrorKind::None;
    }

private:
    std::string messages_;
    size_t count_ = 0;
    ErrorKind first_kind_ = ErrorKind::None;
};

}  // namespace sentence_dedup::utils

#endif  // SENTENCE_DEDUP_UTILS_ERROR_ACCUMULATOR_HPP
