#pragma once

#include "embed/Provider.hpp"

namespace tl::embed {

// Deterministic local embedder: identifier tokens hashed into signed buckets, L2-normalized.
class HashingProvider final : public Provider {
public:
    explicit HashingProvider(unsigned int dimensions = 256);

    std::vector<float> embed(const std::string& text) override;

    [[nodiscard]] std::string_view name() const override { return "hashing"; }
    [[nodiscard]] unsigned int dimensions() const override { return dimensions_; }

private:
    unsigned int dimensions_;
};

}
