#pragma once

#include "crypto/util/encrypt.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tl::crypto {

struct Sealed {
    std::vector<uint8_t> ciphertext;   // includes auth tag
    std::vector<uint8_t> nonce;
};

// Holds the symmetric key used to encrypt embedding vectors. The key never leaves this object.
class KeyRing {
public:
    // Loads the base64 key at keyFile, generating it (mode 0600) on first use.
    KeyRing(const std::filesystem::path& keyFile, util::Cipher cipher, std::string keyId = {});

    KeyRing(std::vector<uint8_t> key, util::Cipher cipher, std::string keyId = {});

    ~KeyRing();

    KeyRing(const KeyRing&) = delete;
    KeyRing& operator=(const KeyRing&) = delete;

    [[nodiscard]] const std::string& keyId() const { return keyId_; }
    [[nodiscard]] util::Cipher cipher() const { return cipher_; }

    [[nodiscard]] Sealed seal(const std::vector<uint8_t>& plaintext, std::string_view aad) const;

    [[nodiscard]] std::vector<uint8_t> open(const std::vector<uint8_t>& ciphertext,
                                            const std::vector<uint8_t>& nonce,
                                            std::string_view aad) const;

    static std::vector<uint8_t> generateKey();

private:
    std::vector<uint8_t> key_;
    util::Cipher cipher_;
    std::string keyId_;

    void loadOrCreate(const std::filesystem::path& keyFile);
    void finishInit(std::string keyId);
};

}
