#pragma once

#include "index/model/EmbeddingRecord.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tl::crypto { class KeyRing; }
namespace tl::config { struct VectorIndexConfig; }

namespace tl::index {

using QueryHit = std::pair<std::string, float>;    // chunkHash, cosine score

// Store of encrypted embedding records keyed by chunk hash.
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    // Returns whether the record was stored.
    virtual bool upsert(const model::EmbeddingRecord& record) = 0;

    virtual void erase(const std::string& chunkHash) = 0;

    [[nodiscard]] virtual bool contains(const std::string& chunkHash) const = 0;

    [[nodiscard]] virtual std::optional<model::EmbeddingRecord> get(const std::string& chunkHash) const = 0;

    [[nodiscard]] virtual size_t size() const = 0;

    // Makes earlier upserts and erases durable.
    virtual void flush() {}

    // Top-k by cosine similarity. Records are decrypted with keys; unreadable records are skipped.
    [[nodiscard]] virtual std::vector<QueryHit> query(const std::vector<float>& vector, size_t k,
                                                      const crypto::KeyRing& keys) const = 0;
};

// Opens the index for one project, given that project's state directory.
using VectorIndexFactory = std::function<std::shared_ptr<VectorIndex>(const std::filesystem::path& projectDir)>;

VectorIndexFactory makeVectorIndexFactory(const config::VectorIndexConfig& cfg);

// Little-endian float32, as encrypted into EmbeddingRecord::encryptedVector.
std::vector<uint8_t> packVector(const std::vector<float>& v);
std::vector<float> unpackVector(const std::vector<uint8_t>& bytes);

}
