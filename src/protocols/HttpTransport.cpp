#include "protocols/HttpTransport.hpp"
#include "util/curlWrappers.hpp"
#include "util/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>

using namespace tl::protocols;
using namespace tl::util;
using nlohmann::json;

HttpTransport::HttpTransport(std::string baseUrl, const unsigned int timeoutSeconds)
    : baseUrl_(std::move(baseUrl)), timeoutSeconds_(timeoutSeconds) {
    while (!baseUrl_.empty() && baseUrl_.back() == '/') baseUrl_.pop_back();
}

json HttpTransport::call(const std::string_view op, const json& body) {
    if (interrupted()) throw CancelledError("Call to " + std::string(op) + " interrupted");

    const auto url = fmt::format("{}/v1/{}", baseUrl_, op);
    const auto payload = body.is_null() ? std::string{} : body.dump();

    SList headers;
    headers.add("Content-Type: application/json");
    headers.add("Accept: application/json");

    const auto res = performCurl([&](CURL* h) {
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        if (!body.is_null()) {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, payload.c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(payload.size()));
        }
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeoutSeconds_));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeoutSeconds_));
    }, interrupt_);

    if (res.aborted()) throw CancelledError("Call to " + std::string(op) + " aborted");

    if (res.curl != CURLE_OK) {
        log::Registry::http()->warn("[HttpTransport] {} failed: {}", url, res.error);
        throw TransientNetworkError(fmt::format("{}: {}", url, res.error));
    }

    json out;
    try {
        out = res.body.empty() ? json::object() : json::parse(res.body);
    } catch (const json::exception& e) {
        if (res.http >= 500) throw TransientNetworkError(fmt::format("{} returned HTTP {}", url, res.http));
        throw ProtocolError(fmt::format("{} returned malformed JSON: {}", url, e.what()));
    }

    if (!res.ok()) {
        log::Registry::http()->warn("[HttpTransport] {} returned HTTP {}", url, res.http);
        rethrowRemoteError(out.value("kind", std::string{}), out.value("error", std::string{}), res.http);
    }

    return out;
}
