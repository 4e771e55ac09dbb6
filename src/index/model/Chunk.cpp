#include "index/model/Chunk.hpp"
#include "index/model/EmbeddingRecord.hpp"
#include "crypto/util/encrypt.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"

#include <nlohmann/json.hpp>

using namespace tl::index::model;
using namespace tl::crypto::util;

void tl::index::model::to_json(nlohmann::json& j, const Warning& w) {
    j = {
        {"path", w.path},
        {"kind", w.kind},
        {"message", w.message}
    };
}

void tl::index::model::from_json(const nlohmann::json& j, Warning& w) {
    j.at("path").get_to(w.path);
    w.kind = j.value("kind", std::string{});
    w.message = j.value("message", std::string{});
}

void tl::index::model::to_json(nlohmann::json& j, const EmbeddingRecord& r) {
    j = {
        {"chunkHash", r.chunkHash},
        {"encryptedVector", b64_encode(r.encryptedVector)},
        {"nonce", b64_encode(r.nonce)},
        {"keyId", r.keyId}
    };
}

void tl::index::model::from_json(const nlohmann::json& j, EmbeddingRecord& r) {
    j.at("chunkHash").get_to(r.chunkHash);
    if (!crypto::hash::isDigest(r.chunkHash)) throw ProtocolError("Malformed chunk hash: " + r.chunkHash);
    try {
        r.encryptedVector = b64_decode(j.at("encryptedVector").get<std::string>());
        r.nonce = b64_decode(j.at("nonce").get<std::string>());
    } catch (const std::invalid_argument& e) {
        throw ProtocolError(std::string("Embedding record for ") + r.chunkHash + ": " + e.what());
    }
    j.at("keyId").get_to(r.keyId);
}
