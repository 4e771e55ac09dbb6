#pragma once

#include "index/VectorIndex.hpp"

#include <memory>
#include <mutex>
#include <set>

namespace tl::protocols { class Transport; }

namespace tl::index {

// Forwards records to an external store through upsertEmbedding / deleteEmbedding.
class RemoteVectorIndex final : public VectorIndex {
public:
    explicit RemoteVectorIndex(std::shared_ptr<protocols::Transport> transport);

    bool upsert(const model::EmbeddingRecord& record) override;
    void erase(const std::string& chunkHash) override;

    [[nodiscard]] bool contains(const std::string& chunkHash) const override;
    [[nodiscard]] std::optional<model::EmbeddingRecord> get(const std::string& chunkHash) const override;
    [[nodiscard]] size_t size() const override;

    [[nodiscard]] std::vector<QueryHit> query(const std::vector<float>& vector, size_t k,
                                              const crypto::KeyRing& keys) const override;

private:
    std::shared_ptr<protocols::Transport> transport_;
    mutable std::mutex mutex_;
    mutable std::set<std::string> known_;
};

}
