#include "crypto/util/hash.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>

namespace tl::crypto::hash {

void ensure_sodium_init() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (sodium_init() < 0) throw std::runtime_error("libsodium initialization failed");
    });
}

std::string toHex(const uint8_t* data, const size_t len) {
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data, len);
    out.resize(len * 2);
    return out;
}

std::string blake2b(const std::filesystem::path& filepath) {
    std::ifstream file(filepath, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open file for hashing: " + filepath.string());

    Hasher h;
    char buffer[8192];
    while (file) {
        file.read(buffer, sizeof(buffer));
        if (file.gcount() > 0) h.update(std::string_view(buffer, static_cast<size_t>(file.gcount())));
    }

    if (file.bad()) throw std::runtime_error("Read error while hashing: " + filepath.string());
    return h.finalHex();
}

std::string blake2b(const std::string_view data) {
    ensure_sodium_init();
    uint8_t out[DIGEST_BYTES];
    crypto_generichash(out, DIGEST_BYTES,
                       reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                       nullptr, 0);
    return toHex(out, DIGEST_BYTES);
}

std::string blake2b(const std::vector<uint8_t>& data) {
    return blake2b(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

bool isDigest(const std::string_view hex) {
    if (hex.size() != DIGEST_HEX_CHARS) return false;
    for (const char c : hex)
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    return true;
}

Hasher::Hasher() {
    ensure_sodium_init();
    crypto_generichash_init(&state_, nullptr, 0, DIGEST_BYTES);
}

Hasher& Hasher::update(const std::string_view data) {
    if (finalized_) throw std::logic_error("Hasher already finalized");
    crypto_generichash_update(&state_, reinterpret_cast<const unsigned char*>(data.data()), data.size());
    return *this;
}

Hasher& Hasher::update(const char c) { return update(std::string_view(&c, 1)); }

std::string Hasher::finalHex() {
    if (finalized_) throw std::logic_error("Hasher already finalized");
    uint8_t out[DIGEST_BYTES];
    crypto_generichash_final(&state_, out, DIGEST_BYTES);
    finalized_ = true;
    return toHex(out, DIGEST_BYTES);
}

}
