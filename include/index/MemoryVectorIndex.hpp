#pragma once

#include "index/VectorIndex.hpp"

#include <map>
#include <mutex>

namespace tl::index {

class MemoryVectorIndex : public VectorIndex {
public:
    MemoryVectorIndex() = default;

    bool upsert(const model::EmbeddingRecord& record) override;
    void erase(const std::string& chunkHash) override;

    [[nodiscard]] bool contains(const std::string& chunkHash) const override;
    [[nodiscard]] std::optional<model::EmbeddingRecord> get(const std::string& chunkHash) const override;
    [[nodiscard]] size_t size() const override;

    [[nodiscard]] std::vector<QueryHit> query(const std::vector<float>& vector, size_t k,
                                              const crypto::KeyRing& keys) const override;

protected:
    mutable std::mutex mutex_;
    std::map<std::string, model::EmbeddingRecord> records_;
};

}
