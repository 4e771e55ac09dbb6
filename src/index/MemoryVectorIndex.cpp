#include "index/MemoryVectorIndex.hpp"
#include "crypto/KeyRing.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cmath>

using namespace tl::index;
using namespace tl::index::model;

bool MemoryVectorIndex::upsert(const EmbeddingRecord& record) {
    std::scoped_lock lock(mutex_);
    records_[record.chunkHash] = record;
    return true;
}

void MemoryVectorIndex::erase(const std::string& chunkHash) {
    std::scoped_lock lock(mutex_);
    records_.erase(chunkHash);
}

bool MemoryVectorIndex::contains(const std::string& chunkHash) const {
    std::scoped_lock lock(mutex_);
    return records_.contains(chunkHash);
}

std::optional<EmbeddingRecord> MemoryVectorIndex::get(const std::string& chunkHash) const {
    std::scoped_lock lock(mutex_);
    const auto it = records_.find(chunkHash);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

size_t MemoryVectorIndex::size() const {
    std::scoped_lock lock(mutex_);
    return records_.size();
}

static float cosine(const std::vector<float>& a, const std::vector<float>& b) {
    double dot = 0, na = 0, nb = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        na += static_cast<double>(a[i]) * a[i];
        nb += static_cast<double>(b[i]) * b[i];
    }
    if (na == 0 || nb == 0) return 0.0f;
    return static_cast<float>(dot / (std::sqrt(na) * std::sqrt(nb)));
}

std::vector<QueryHit> MemoryVectorIndex::query(const std::vector<float>& vector, const size_t k,
                                               const crypto::KeyRing& keys) const {
    std::vector<QueryHit> hits;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [hash, rec] : records_) {
            if (rec.keyId != keys.keyId()) continue;
            try {
                const auto v = unpackVector(keys.open(rec.encryptedVector, rec.nonce, hash));
                if (v.size() != vector.size()) continue;
                hits.emplace_back(hash, cosine(vector, v));
            } catch (const std::exception& e) {
                log::Registry::index()->warn("[VectorIndex] Skipping unreadable record {}: {}", hash, e.what());
            }
        }
    }

    const auto n = std::min(k, hits.size());
    std::partial_sort(hits.begin(), hits.begin() + static_cast<long>(n), hits.end(),
                      [](const QueryHit& a, const QueryHit& b) {
                          return a.second > b.second || (a.second == b.second && a.first < b.first);
                      });
    hits.resize(n);
    return hits;
}
