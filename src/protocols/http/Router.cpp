#include "protocols/http/Router.hpp"
#include "protocols/Dispatcher.hpp"
#include "log/Registry.hpp"

#include <nlohmann/json.hpp>

using namespace tl::protocols::http;

static constexpr std::string_view API_PREFIX = "/v1/";

static bool isReadOnlyOp(const std::string_view op) {
    return op == "health" || op == "projects";
}

string_response Router::route(request&& req, Dispatcher& dispatcher) {
    std::string_view target(req.target().data(), req.target().size());
    if (const auto q = target.find('?'); q != std::string_view::npos) target = target.substr(0, q);

    if (!target.starts_with(API_PREFIX))
        return makeErrorResponse(req, "Not found", status::not_found);

    const auto op = target.substr(API_PREFIX.size());
    if (op.empty() || op.find('/') != std::string_view::npos)
        return makeErrorResponse(req, "Not found", status::not_found);

    nlohmann::json body;
    if (isReadOnlyOp(op)) {
        if (req.method() != verb::get && req.method() != verb::post)
            return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
    } else {
        if (req.method() != verb::post)
            return makeErrorResponse(req, "Method not allowed", status::method_not_allowed);
        body = nlohmann::json::parse(req.body(), nullptr, false);
        if (body.is_discarded())
            return makeErrorResponse(req, "Request body is not valid JSON", status::bad_request);
    }

    auto res = dispatcher.handle(op, body);
    return makeJsonResponse(req, res.body, static_cast<status>(res.status));
}

string_response Router::makeJsonResponse(const request& req, const nlohmann::json& j, const status s) {
    string_response res{s, req.version()};
    res.set(field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = j.dump();
    res.prepare_payload();
    return res;
}

string_response Router::makeErrorResponse(const request& req, const std::string& msg,
                                          const status s, const std::string& kind) {
    log::Registry::http()->debug("[Router] {} {} -> {}: {}", std::string(req.method_string()),
                                 std::string(req.target()), static_cast<unsigned>(s), msg);
    return makeJsonResponse(req, nlohmann::json{{"error", msg}, {"kind", kind}}, s);
}
