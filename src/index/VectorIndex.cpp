#include "index/VectorIndex.hpp"
#include "index/MemoryVectorIndex.hpp"
#include "index/FileVectorIndex.hpp"
#include "index/RemoteVectorIndex.hpp"
#include "protocols/HttpTransport.hpp"
#include "config/Config.hpp"
#include "util/errors.hpp"

#include <bit>
#include <stdexcept>

using namespace tl::index;

std::vector<uint8_t> tl::index::packVector(const std::vector<float>& v) {
    std::vector<uint8_t> out;
    out.reserve(v.size() * 4);
    for (const float f : v) {
        const auto bits = std::bit_cast<uint32_t>(f);
        for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(bits >> (8 * i)));
    }
    return out;
}

std::vector<float> tl::index::unpackVector(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 4 != 0) throw EncryptionError("Decrypted vector has a truncated element");
    std::vector<float> out;
    out.reserve(bytes.size() / 4);
    for (size_t i = 0; i < bytes.size(); i += 4) {
        uint32_t bits = 0;
        for (int b = 0; b < 4; ++b) bits |= static_cast<uint32_t>(bytes[i + b]) << (8 * b);
        out.push_back(std::bit_cast<float>(bits));
    }
    return out;
}

VectorIndexFactory tl::index::makeVectorIndexFactory(const config::VectorIndexConfig& cfg) {
    if (cfg.kind == "memory")
        return [](const std::filesystem::path&) -> std::shared_ptr<VectorIndex> {
            return std::make_shared<MemoryVectorIndex>();
        };

    if (cfg.kind == "file")
        return [](const std::filesystem::path& projectDir) -> std::shared_ptr<VectorIndex> {
            return std::make_shared<FileVectorIndex>(projectDir / "embeddings.json");
        };

    if (cfg.kind == "http")
        return [endpoint = cfg.endpoint, timeout = cfg.timeout_seconds](const std::filesystem::path&) -> std::shared_ptr<VectorIndex> {
            return std::make_shared<RemoteVectorIndex>(std::make_shared<protocols::HttpTransport>(endpoint, timeout));
        };

    throw std::invalid_argument("Unknown vector index kind: " + cfg.kind);
}
