#pragma once

#include "embed/Provider.hpp"
#include "config/Config.hpp"

namespace tl::embed {

// OpenAI-compatible embeddings endpoint: POST {"model","input"} -> data[0].embedding
class HttpProvider final : public Provider {
public:
    explicit HttpProvider(config::EmbeddingConfig cfg);

    std::vector<float> embed(const std::string& text) override;

    [[nodiscard]] std::string_view name() const override { return "http"; }
    [[nodiscard]] unsigned int dimensions() const override { return cfg_.dimensions; }

private:
    config::EmbeddingConfig cfg_;
    std::string apiKey_;

    std::string buildRequest(const std::string& text) const;
    static std::vector<float> parseResponse(const std::string& body);
};

}
