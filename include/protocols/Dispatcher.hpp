#pragma once

#include <memory>
#include <string_view>
#include <nlohmann/json.hpp>

namespace tl::sync { class Server; }

namespace tl::protocols {

struct Response {
    unsigned int status = 200;
    nlohmann::json body;
};

// Maps wire operations onto sync::Server. Shared by the HTTP router and the loopback transport.
class Dispatcher {
public:
    explicit Dispatcher(std::shared_ptr<sync::Server> server);

    // Never throws: failures become {"error", "kind"} with status 400, 404 or 500.
    Response handle(std::string_view op, const nlohmann::json& body);

    [[nodiscard]] sync::Server& server() const { return *server_; }

private:
    std::shared_ptr<sync::Server> server_;

    nlohmann::json dispatch(std::string_view op, const nlohmann::json& body);
};

}
