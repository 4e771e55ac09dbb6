#include "embed/HashingProvider.hpp"
#include "crypto/util/hash.hpp"

#include <cctype>
#include <cmath>
#include <cstring>
#include <stdexcept>

using namespace tl::embed;

HashingProvider::HashingProvider(const unsigned int dimensions) : dimensions_(dimensions) {
    if (dimensions_ == 0) throw std::invalid_argument("Embedding dimensions must be positive");
}

std::vector<float> HashingProvider::embed(const std::string& text) {
    crypto::hash::ensure_sodium_init();
    std::vector<float> v(dimensions_, 0.0f);

    const auto addToken = [&](const std::string& tok) {
        uint8_t h[8];
        crypto_generichash(h, sizeof(h), reinterpret_cast<const unsigned char*>(tok.data()), tok.size(), nullptr, 0);
        uint32_t bucket;
        std::memcpy(&bucket, h, sizeof(bucket));
        v[bucket % dimensions_] += (h[4] & 1) ? 1.0f : -1.0f;
    };

    std::string tok;
    for (const char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '_') {
            tok.push_back(static_cast<char>(std::tolower(c)));
        } else if (!tok.empty()) {
            addToken(tok);
            tok.clear();
        }
    }
    if (!tok.empty()) addToken(tok);

    double norm = 0.0;
    for (const float x : v) norm += static_cast<double>(x) * x;
    if (norm > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& x : v) x *= inv;
    }
    return v;
}
