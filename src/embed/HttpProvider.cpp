#include "embed/HttpProvider.hpp"
#include "embed/HashingProvider.hpp"
#include "util/curlWrappers.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <cstdlib>

using namespace tl::embed;
using namespace tl::util;

HttpProvider::HttpProvider(config::EmbeddingConfig cfg) : cfg_(std::move(cfg)) {
    if (!cfg_.api_key_env.empty())
        if (const char* key = std::getenv(cfg_.api_key_env.c_str())) apiKey_ = key;
}

std::string HttpProvider::buildRequest(const std::string& text) const {
    nlohmann::json body = {
        {"model", cfg_.model},
        {"input", text},
        {"encoding_format", "float"}
    };
    if (cfg_.dimensions > 0) body["dimensions"] = cfg_.dimensions;
    return body.dump();
}

std::vector<float> HttpProvider::parseResponse(const std::string& body) {
    try {
        const auto j = nlohmann::json::parse(body);
        const auto& data = j.at("data");
        if (!data.is_array() || data.empty()) throw EmbeddingProviderError("Empty embedding response");
        return data.at(0).at("embedding").get<std::vector<float>>();
    } catch (const nlohmann::json::exception& e) {
        throw EmbeddingProviderError(std::string("Invalid embedding response: ") + e.what());
    }
}

std::vector<float> HttpProvider::embed(const std::string& text) {
    const auto payload = buildRequest(text);

    SList headers;
    headers.add("Content-Type: application/json");
    if (!apiKey_.empty()) headers.add("Authorization: Bearer " + apiKey_);

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, cfg_.endpoint.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(cfg_.timeout_seconds));
    });

    if (res.curl != CURLE_OK) {
        log::Registry::embed()->warn("[HttpProvider] Request to {} failed: {}", cfg_.endpoint, res.error);
        throw EmbeddingProviderError("Embedding request failed: " + res.error);
    }

    if (!res.ok()) {
        log::Registry::embed()->warn("[HttpProvider] {} returned HTTP {}", cfg_.endpoint, res.http);
        throw EmbeddingProviderError(fmt::format("Embedding provider returned HTTP {}", res.http));
    }

    auto v = parseResponse(res.body);
    if (cfg_.dimensions > 0 && v.size() != cfg_.dimensions)
        throw EmbeddingProviderError(fmt::format("Expected {} dimensions, provider returned {}", cfg_.dimensions, v.size()));
    return v;
}

std::shared_ptr<Provider> tl::embed::makeProvider(const config::EmbeddingConfig& cfg) {
    if (cfg.provider == "hashing") return std::make_shared<HashingProvider>(cfg.dimensions);
    if (cfg.provider == "http") return std::make_shared<HttpProvider>(cfg);
    throw std::invalid_argument("Unknown embedding provider: " + cfg.provider);
}
