#pragma once

#include "protocols/Transport.hpp"

#include <string>

namespace tl::protocols {

// POST <baseUrl>/v1/<op> with a JSON body, GET when the body is null. libcurl underneath.
class HttpTransport : public Transport {
public:
    HttpTransport(std::string baseUrl, unsigned int timeoutSeconds);

    nlohmann::json call(std::string_view op, const nlohmann::json& body) override;

    [[nodiscard]] const std::string& baseUrl() const { return baseUrl_; }

private:
    std::string baseUrl_;
    unsigned int timeoutSeconds_;
};

}
