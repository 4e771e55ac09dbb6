#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tl::index::model {

// The only artifact stored per chunk: ciphertext of the vector, never the text.
struct EmbeddingRecord {
    std::string chunkHash;
    std::vector<uint8_t> encryptedVector;   // AEAD ciphertext incl. tag
    std::vector<uint8_t> nonce;
    std::string keyId;

    [[nodiscard]] bool operator==(const EmbeddingRecord&) const = default;
};

// encryptedVector and nonce travel as base64.
void to_json(nlohmann::json& j, const EmbeddingRecord& r);
void from_json(const nlohmann::json& j, EmbeddingRecord& r);

}
