#include "index/Chunker.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <stdexcept>

using namespace tl::index;
using namespace tl::index::model;

Chunker::Chunker(const size_t maxChars) : maxChars_(maxChars) {
    if (maxChars_ == 0) throw std::invalid_argument("Chunk budget must be positive");
}

ChunkResult Chunker::split(const std::string& path, const std::string_view content) const {
    ChunkResult out;

    uint64_t chunkStart = 0;      // byte offset of the open chunk
    uint32_t chunkLine = 0;       // first line of the open chunk
    uint64_t pos = 0;
    uint32_t line = 0;

    const auto emit = [&](const uint64_t end, const uint32_t endLine, const bool oversized) {
        if (end == chunkStart) return;
        Chunk c;
        c.sourcePath = path;
        c.chunkIndex = static_cast<uint32_t>(out.chunks.size());
        c.tokenRange = {chunkLine, endLine, chunkStart, end};
        c.text = std::string(content.substr(chunkStart, end - chunkStart));
        c.contentHash = crypto::hash::blake2b(c.text);
        c.oversized = oversized;
        out.chunks.push_back(std::move(c));
        chunkStart = end;
        chunkLine = endLine;
    };

    while (pos < content.size()) {
        const auto nl = content.find('\n', pos);
        const uint64_t lineEnd = nl == std::string_view::npos ? content.size() : nl + 1;
        const uint64_t lineLen = lineEnd - pos;

        if (lineLen > maxChars_) {
            emit(pos, line, false);
            emit(lineEnd, line + 1, true);

            const ChunkTooLargeError err(fmt::format("line {} is {} bytes, budget is {}", line + 1, lineLen, maxChars_));
            log::Registry::index()->warn("[Chunker] {}: {}", path, err.what());
            out.warnings.push_back({path, std::string(err.kind()), err.what()});
        } else if (lineEnd - chunkStart > maxChars_) {
            emit(pos, line, false);
        }

        pos = lineEnd;
        ++line;
    }

    emit(pos, line, false);
    return out;
}
