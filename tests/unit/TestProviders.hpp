#pragma once

#include "embed/HashingProvider.hpp"
#include "util/errors.hpp"

#include <atomic>
#include <set>
#include <string>

// Counts calls and fails the first `failures` of them, or every call whose text contains `poison`.
class FlakyProvider final : public tl::embed::Provider {
public:
    explicit FlakyProvider(const unsigned int failures = 0, std::string poison = {})
        : failuresLeft_(failures), poison_(std::move(poison)) {}

    std::vector<float> embed(const std::string& text) override {
        ++calls;
        if (!poison_.empty() && text.find(poison_) != std::string::npos)
            throw tl::EmbeddingProviderError("poisoned input");
        if (failuresLeft_ > 0) {
            --failuresLeft_;
            throw tl::EmbeddingProviderError("provider unavailable");
        }
        return inner_.embed(text);
    }

    [[nodiscard]] std::string_view name() const override { return "flaky"; }
    [[nodiscard]] unsigned int dimensions() const override { return inner_.dimensions(); }

    std::atomic<unsigned int> calls{0};

private:
    tl::embed::HashingProvider inner_{32};
    std::atomic<unsigned int> failuresLeft_;
    std::string poison_;
};

inline bool noSleep(std::chrono::milliseconds) { return true; }
