#include "index/RemoteVectorIndex.hpp"
#include "protocols/Transport.hpp"
#include "crypto/KeyRing.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

using namespace tl::index;
using namespace tl::index::model;
using nlohmann::json;

RemoteVectorIndex::RemoteVectorIndex(std::shared_ptr<protocols::Transport> transport)
    : transport_(std::move(transport)) {}

bool RemoteVectorIndex::upsert(const EmbeddingRecord& record) {
    const auto res = transport_->call("upsertEmbedding", json(record));
    const bool stored = res.value("stored", false);
    if (stored) {
        std::scoped_lock lock(mutex_);
        known_.insert(record.chunkHash);
    } else {
        log::Registry::index()->warn("[RemoteVectorIndex] Store refused record {}", record.chunkHash);
    }
    return stored;
}

void RemoteVectorIndex::erase(const std::string& chunkHash) {
    transport_->call("deleteEmbedding", json{{"chunkHash", chunkHash}});
    std::scoped_lock lock(mutex_);
    known_.erase(chunkHash);
}

bool RemoteVectorIndex::contains(const std::string& chunkHash) const {
    {
        std::scoped_lock lock(mutex_);
        if (known_.contains(chunkHash)) return true;
    }
    const bool found = get(chunkHash).has_value();
    if (found) {
        std::scoped_lock lock(mutex_);
        known_.insert(chunkHash);
    }
    return found;
}

std::optional<EmbeddingRecord> RemoteVectorIndex::get(const std::string& chunkHash) const {
    const auto res = transport_->call("getEmbedding", json{{"chunkHash", chunkHash}});
    if (!res.value("found", false)) return std::nullopt;
    return res.at("record").get<EmbeddingRecord>();
}

size_t RemoteVectorIndex::size() const {
    std::scoped_lock lock(mutex_);
    return known_.size();
}

std::vector<QueryHit> RemoteVectorIndex::query(const std::vector<float>& vector, const size_t k,
                                               const crypto::KeyRing& keys) const {
    // The store decrypts with its own key ring, so it must hold the same key id.
    const auto res = transport_->call("queryEmbeddings", json{{"vector", vector}, {"k", k}, {"keyId", keys.keyId()}});

    std::vector<QueryHit> hits;
    for (const auto& h : res.at("hits"))
        hits.emplace_back(h.at("chunkHash").get<std::string>(), h.at("score").get<float>());
    return hits;
}
