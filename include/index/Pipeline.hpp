#pragma once

#include "index/Chunker.hpp"
#include "index/model/EmbeddingRecord.hpp"
#include "config/Config.hpp"
#include "util/retry.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tl::embed { class Provider; }
namespace tl::crypto { class KeyRing; }

namespace tl::index {

struct FileOutcome {
    std::vector<std::string> chunkHashes;           // every chunk of the file, in order
    std::vector<model::EmbeddingRecord> records;    // only chunks that had no record yet
    std::vector<model::Warning> warnings;
};

// chunk -> embed -> encrypt. Never emits anything derived from plaintext except hashes and ciphertext.
class Pipeline {
public:
    Pipeline(std::shared_ptr<embed::Provider> provider,
             std::shared_ptr<crypto::KeyRing> keys,
             Chunker chunker,
             config::RetryConfig retry,
             util::SleepFn sleep = util::blockingSleep);

    /**
     * hasRecord tells whether a chunk hash is already embedded; those chunks are not re-sent to the provider.
     * Throws EmbeddingProviderError once a chunk exhausts its retries, EncryptionError on any cipher failure.
     */
    [[nodiscard]] FileOutcome process(const std::string& path, std::string_view content,
                                      const std::function<bool(const std::string&)>& hasRecord) const;

    [[nodiscard]] model::EmbeddingRecord seal(const std::string& chunkHash, const std::vector<float>& vector) const;

    [[nodiscard]] std::vector<float> open(const model::EmbeddingRecord& record) const;

    [[nodiscard]] const crypto::KeyRing& keys() const { return *keys_; }
    [[nodiscard]] const Chunker& chunker() const { return chunker_; }
    [[nodiscard]] embed::Provider& provider() const { return *provider_; }

private:
    std::shared_ptr<embed::Provider> provider_;
    std::shared_ptr<crypto::KeyRing> keys_;
    Chunker chunker_;
    config::RetryConfig retry_;
    util::SleepFn sleep_;
};

}
