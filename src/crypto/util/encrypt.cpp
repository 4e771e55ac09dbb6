#include "crypto/util/encrypt.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <sodium.h>
#include <stdexcept>
#include <cstring>

namespace tl::crypto::util {

Cipher parseCipher(const std::string_view name) {
    if (name == "xchacha20poly1305") return Cipher::XChaCha20Poly1305;
    if (name == "aes256gcm") return Cipher::Aes256Gcm;
    throw std::invalid_argument("Unknown cipher: " + std::string(name));
}

std::string_view cipherName(const Cipher c) {
    switch (c) {
        case Cipher::XChaCha20Poly1305: return "xchacha20poly1305";
        case Cipher::Aes256Gcm: return "aes256gcm";
    }
    return "unknown";
}

size_t nonceSize(const Cipher c) {
    return c == Cipher::Aes256Gcm ? crypto_aead_aes256gcm_NPUBBYTES
                                  : crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
}

bool isCipherAvailable(const Cipher c) {
    hash::ensure_sodium_init();
    if (c == Cipher::Aes256Gcm) return crypto_aead_aes256gcm_is_available() != 0;
    return true;
}

std::vector<uint8_t> aead_encrypt(
    const Cipher cipher,
    const std::vector<uint8_t>& plaintext,
    const std::string_view aad,
    const std::vector<uint8_t>& key,
    std::vector<uint8_t>& out_nonce)
{
    if (key.size() != KEY_SIZE) {
        log::Registry::crypto()->error("[aead_encrypt] Invalid key size: {} bytes", key.size());
        throw EncryptionError("Invalid 256-bit key size");
    }

    if (!isCipherAvailable(cipher))
        throw EncryptionError(std::string(cipherName(cipher)) + " not supported on this CPU");

    out_nonce.resize(nonceSize(cipher));
    randombytes_buf(out_nonce.data(), out_nonce.size());

    std::vector<uint8_t> ciphertext(plaintext.size() + TAG_SIZE);
    unsigned long long ciphertext_len = 0;
    const auto* ad = reinterpret_cast<const unsigned char*>(aad.data());

    int rc;
    if (cipher == Cipher::Aes256Gcm)
        rc = crypto_aead_aes256gcm_encrypt(
            ciphertext.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            ad, aad.size(),
            nullptr, out_nonce.data(), key.data());
    else
        rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
            ciphertext.data(), &ciphertext_len,
            plaintext.data(), plaintext.size(),
            ad, aad.size(),
            nullptr, out_nonce.data(), key.data());

    if (rc != 0) {
        log::Registry::crypto()->error("[aead_encrypt] {} encryption failed", cipherName(cipher));
        throw EncryptionError("AEAD encryption failed");
    }

    ciphertext.resize(ciphertext_len);
    return ciphertext;
}

std::vector<uint8_t> aead_decrypt(
    const Cipher cipher,
    const std::vector<uint8_t>& ciphertext_with_tag,
    const std::string_view aad,
    const std::vector<uint8_t>& key,
    const std::vector<uint8_t>& nonce)
{
    if (key.size() != KEY_SIZE || nonce.size() != nonceSize(cipher)) {
        log::Registry::crypto()->error("[aead_decrypt] Invalid key or nonce size: "
                                       "key size = {}, nonce size = {}",
                                       key.size(), nonce.size());
        throw EncryptionError("Invalid key or nonce size");
    }

    if (ciphertext_with_tag.size() < TAG_SIZE) throw EncryptionError("Ciphertext shorter than auth tag");

    if (!isCipherAvailable(cipher))
        throw EncryptionError(std::string(cipherName(cipher)) + " not supported on this CPU");

    std::vector<uint8_t> decrypted(ciphertext_with_tag.size() - TAG_SIZE);
    unsigned long long decrypted_len = 0;
    const auto* ad = reinterpret_cast<const unsigned char*>(aad.data());

    int rc;
    if (cipher == Cipher::Aes256Gcm)
        rc = crypto_aead_aes256gcm_decrypt(
            decrypted.data(), &decrypted_len, nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            ad, aad.size(), nonce.data(), key.data());
    else
        rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
            decrypted.data(), &decrypted_len, nullptr,
            ciphertext_with_tag.data(), ciphertext_with_tag.size(),
            ad, aad.size(), nonce.data(), key.data());

    if (rc != 0) throw EncryptionError("Decryption failed: authentication error");

    decrypted.resize(decrypted_len);
    return decrypted;
}

std::string b64_encode(const std::vector<uint8_t>& data) {
    return b64_encode(std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
}

std::string b64_encode(const std::string_view data) {
    hash::ensure_sodium_init();
    const size_t encoded_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string result(encoded_len, '\0');

    sodium_bin2base64(result.data(), result.size(),
                      reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);

    result.resize(std::strlen(result.c_str())); // Trim null terminator
    return result;
}

std::vector<uint8_t> b64_decode(const std::string& b64) {
    hash::ensure_sodium_init();
    std::vector<uint8_t> decoded(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    if (sodium_base642bin(decoded.data(), decoded.size(),
                          b64.c_str(), b64.size(),
                          nullptr, &out_len, nullptr,
                          sodium_base64_VARIANT_ORIGINAL) != 0)
    {
        throw std::invalid_argument("Invalid base64 payload");
    }
    decoded.resize(out_len);
    return decoded;
}

}
