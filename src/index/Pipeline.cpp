#include "index/Pipeline.hpp"
#include "index/VectorIndex.hpp"
#include "embed/Provider.hpp"
#include "crypto/KeyRing.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>
#include <set>

using namespace tl::index;
using namespace tl::index::model;

Pipeline::Pipeline(std::shared_ptr<embed::Provider> provider,
                   std::shared_ptr<crypto::KeyRing> keys,
                   Chunker chunker,
                   config::RetryConfig retry,
                   util::SleepFn sleep)
    : provider_(std::move(provider)),
      keys_(std::move(keys)),
      chunker_(chunker),
      retry_(retry),
      sleep_(std::move(sleep)) {
    if (!provider_ || !keys_) throw std::invalid_argument("Pipeline requires a provider and a key ring");
}

EmbeddingRecord Pipeline::seal(const std::string& chunkHash, const std::vector<float>& vector) const {
    auto sealed = keys_->seal(packVector(vector), chunkHash);
    return {chunkHash, std::move(sealed.ciphertext), std::move(sealed.nonce), keys_->keyId()};
}

std::vector<float> Pipeline::open(const EmbeddingRecord& record) const {
    if (record.keyId != keys_->keyId())
        throw EncryptionError(fmt::format("Record {} was sealed with key {}, have {}",
                                          record.chunkHash, record.keyId, keys_->keyId()));
    return unpackVector(keys_->open(record.encryptedVector, record.nonce, record.chunkHash));
}

FileOutcome Pipeline::process(const std::string& path, const std::string_view content,
                              const std::function<bool(const std::string&)>& hasRecord) const {
    auto split = chunker_.split(path, content);

    FileOutcome out;
    out.warnings = std::move(split.warnings);

    std::set<std::string> sealedHere;
    for (const auto& chunk : split.chunks) {
        out.chunkHashes.push_back(chunk.contentHash);
        if (sealedHere.contains(chunk.contentHash) || (hasRecord && hasRecord(chunk.contentHash))) continue;

        const auto vector = util::withRetry<EmbeddingProviderError>(
            retry_,
            [&] { return provider_->embed(chunk.text); },
            sleep_,
            [] { throw CancelledError("Embedding interrupted"); },
            log::Registry::embed(),
            fmt::format("embed {}#{}", path, chunk.chunkIndex));

        if (vector.empty()) throw EmbeddingProviderError(fmt::format("Provider returned an empty vector for {}#{}",
                                                                     path, chunk.chunkIndex));

        try {
            out.records.push_back(seal(chunk.contentHash, vector));
        } catch (const EncryptionError& e) {
            log::Registry::crypto()->error("[Pipeline] Encryption failed for {}#{}: {}", path, chunk.chunkIndex, e.what());
            throw;
        }
        sealedHere.insert(chunk.contentHash);
    }

    log::Registry::index()->debug("[Pipeline] {}: {} chunks, {} newly sealed", path, out.chunkHashes.size(),
                                  out.records.size());
    return out;
}
