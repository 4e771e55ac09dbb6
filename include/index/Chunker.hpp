#pragma once

#include "index/model/Chunk.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tl::index {

struct ChunkResult {
    std::vector<model::Chunk> chunks;
    std::vector<model::Warning> warnings;   // ChunkTooLargeError, one per oversized line
};

/**
 * Splits file content into line-aligned chunks of at most maxChars bytes.
 *
 * Lines are packed greedily. A single line longer than the budget becomes
 * its own chunk, untruncated, and is reported as a warning. Identical
 * content always yields identical boundaries and hashes.
 */
class Chunker {
public:
    static constexpr size_t DEFAULT_MAX_CHARS = 1500;

    explicit Chunker(size_t maxChars = DEFAULT_MAX_CHARS);

    [[nodiscard]] ChunkResult split(const std::string& path, std::string_view content) const;

    [[nodiscard]] size_t maxChars() const { return maxChars_; }

private:
    size_t maxChars_;
};

}
