#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace tl::config { struct EmbeddingConfig; }

namespace tl::embed {

class Provider {
public:
    virtual ~Provider() = default;

    // Throws EmbeddingProviderError on any retryable failure.
    virtual std::vector<float> embed(const std::string& text) = 0;

    [[nodiscard]] virtual std::string_view name() const = 0;

    [[nodiscard]] virtual unsigned int dimensions() const = 0;
};

// Selected by cfg.provider: "hashing" or "http".
std::shared_ptr<Provider> makeProvider(const config::EmbeddingConfig& cfg);

}
