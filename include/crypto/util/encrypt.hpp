#pragma once

#include <vector>
#include <cstdint>
#include <string>
#include <string_view>

namespace tl::crypto::util {

constexpr size_t KEY_SIZE = 32;      // 256-bit, both ciphers
constexpr size_t TAG_SIZE = 16;      // Poly1305 / GCM auth tag

enum class Cipher {
    XChaCha20Poly1305,
    Aes256Gcm
};

Cipher parseCipher(std::string_view name);
std::string_view cipherName(Cipher c);

[[nodiscard]] size_t nonceSize(Cipher c);

// AES-256-GCM needs hardware support in libsodium.
[[nodiscard]] bool isCipherAvailable(Cipher c);

// Fresh random nonce per call, written to out_nonce. The aad is authenticated but not encrypted.
std::vector<uint8_t> aead_encrypt(
    Cipher cipher,
    const std::vector<uint8_t>& plaintext,
    std::string_view aad,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_nonce);

std::vector<uint8_t> aead_decrypt(
    Cipher cipher,
    const std::vector<uint8_t>& ciphertext_with_tag,
    std::string_view aad,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce);

std::string b64_encode(const std::vector<uint8_t>& data);
std::string b64_encode(std::string_view data);

std::vector<uint8_t> b64_decode(const std::string& b64);

}
