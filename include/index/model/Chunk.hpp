#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace tl::index::model {

// Half-open ranges within the source file.
struct TokenRange {
    uint32_t lineBegin{0}, lineEnd{0};
    uint64_t byteBegin{0}, byteEnd{0};

    [[nodiscard]] bool operator==(const TokenRange&) const = default;
};

struct Chunk {
    std::string sourcePath;
    uint32_t chunkIndex{0};
    TokenRange tokenRange;
    std::string contentHash;
    std::string text;           // transient; never staged or persisted
    bool oversized{false};
};

// Non-fatal per-path condition reported back in the cycle summary.
struct Warning {
    std::string path;
    std::string kind;
    std::string message;
};

void to_json(nlohmann::json& j, const Warning& w);
void from_json(const nlohmann::json& j, Warning& w);

}
