#include "crypto/KeyRing.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <sodium.h>
#include <fmt/format.h>
#include <fstream>

using namespace tl::crypto;
using namespace tl::crypto::util;

namespace fs = std::filesystem;

KeyRing::KeyRing(const fs::path& keyFile, const Cipher cipher, std::string keyId)
    : cipher_(cipher) {
    loadOrCreate(keyFile);
    finishInit(std::move(keyId));
}

KeyRing::KeyRing(std::vector<uint8_t> key, const Cipher cipher, std::string keyId)
    : key_(std::move(key)), cipher_(cipher) {
    finishInit(std::move(keyId));
}

KeyRing::~KeyRing() {
    if (!key_.empty()) sodium_memzero(key_.data(), key_.size());
}

std::vector<uint8_t> KeyRing::generateKey() {
    hash::ensure_sodium_init();
    std::vector<uint8_t> key(KEY_SIZE);
    randombytes_buf(key.data(), key.size());
    return key;
}

void KeyRing::finishInit(std::string keyId) {
    if (key_.size() != KEY_SIZE) {
        log::Registry::crypto()->error("[KeyRing] Key must be {} bytes, got {}", KEY_SIZE, key_.size());
        throw EncryptionError("Index key must be 32 bytes");
    }

    if (!isCipherAvailable(cipher_))
        throw EncryptionError(fmt::format("Cipher {} is not available on this host", cipherName(cipher_)));

    keyId_ = keyId.empty() ? "k-" + hash::blake2b(key_).substr(0, 16) : std::move(keyId);
    log::Registry::crypto()->debug("[KeyRing] Using key {} with {}", keyId_, cipherName(cipher_));
}

void KeyRing::loadOrCreate(const fs::path& keyFile) {
    std::error_code ec;
    if (fs::exists(keyFile, ec)) {
        std::ifstream in(keyFile);
        if (!in) throw EncryptionError("Failed to open key file: " + keyFile.string());

        std::string b64;
        std::getline(in, b64);
        try {
            key_ = b64_decode(b64);
        } catch (const std::invalid_argument&) {
            log::Registry::crypto()->error("[KeyRing] Key file {} is not valid base64", keyFile.string());
            throw EncryptionError("Malformed key file: " + keyFile.string());
        }
        return;
    }

    key_ = generateKey();

    fs::create_directories(keyFile.parent_path(), ec);
    if (ec) throw EncryptionError(fmt::format("Failed to create key directory {}: {}",
                                              keyFile.parent_path().string(), ec.message()));

    {
        std::ofstream out(keyFile, std::ios::trunc);
        if (!out) throw EncryptionError("Failed to write key file: " + keyFile.string());
        fs::permissions(keyFile, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        out << b64_encode(key_) << '\n';
        if (!out) throw EncryptionError("Failed to write key file: " + keyFile.string());
    }

    if (ec) log::Registry::crypto()->warn("[KeyRing] Could not restrict permissions on {}: {}",
                                          keyFile.string(), ec.message());

    const auto msg = fmt::format("[KeyRing] Created new {} index key at {}", cipherName(cipher_), keyFile.string());
    log::Registry::audit()->info(msg);
    log::Registry::crypto()->info(msg);
}

Sealed KeyRing::seal(const std::vector<uint8_t>& plaintext, const std::string_view aad) const {
    Sealed s;
    s.ciphertext = aead_encrypt(cipher_, plaintext, aad, key_, s.nonce);
    return s;
}

std::vector<uint8_t> KeyRing::open(const std::vector<uint8_t>& ciphertext,
                                   const std::vector<uint8_t>& nonce,
                                   const std::string_view aad) const {
    return aead_decrypt(cipher_, ciphertext, aad, key_, nonce);
}
