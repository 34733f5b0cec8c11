// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/core/ReferenceStream.hpp"

#include <algorithm>

namespace sentence_dedup {

size_t ReferenceStream::referenceCount() const {
    return static_cast<size_t>(std::count_if(tokens.begin(), tokens.end(), [](const StreamToken& token) {
        return token.kind == TokenKind::Reference;
    }));
}

size_t ReferenceStream::literalCount() const {
    return tokens.size() - referenceCount();
}

}  // namespace sentence_dedup
