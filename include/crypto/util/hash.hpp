#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <sodium.h>

namespace tl::crypto::hash {

constexpr size_t DIGEST_BYTES = 32;                 // BLAKE2b-256
constexpr size_t DIGEST_HEX_CHARS = DIGEST_BYTES * 2;

void ensure_sodium_init();

// Hex-encoded BLAKE2b-256 of a file's full content.
std::string blake2b(const std::filesystem::path& filepath);

std::string blake2b(std::string_view data);

std::string blake2b(const std::vector<uint8_t>& data);

[[nodiscard]] bool isDigest(std::string_view hex);

std::string toHex(const uint8_t* data, size_t len);

// Incremental BLAKE2b-256, used where input arrives in pieces.
class Hasher {
public:
    Hasher();

    Hasher& update(std::string_view data);
    Hasher& update(char c);

    [[nodiscard]] std::string finalHex();

private:
    crypto_generichash_state state_{};
    bool finalized_ = false;
};

}
