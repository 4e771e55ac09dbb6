#pragma once

#include <boost/beast/http.hpp>
#include <nlohmann/json_fwd.hpp>
#include <string>

namespace tl::protocols { class Dispatcher; }

namespace tl::protocols::http {

using request = boost::beast::http::request<boost::beast::http::string_body>;
using string_body = boost::beast::http::string_body;
using string_response = boost::beast::http::response<string_body>;

using field = boost::beast::http::field;
using verb = boost::beast::http::verb;
using status = boost::beast::http::status;

// /v1/health and /v1/projects accept GET, every other /v1/<op> accepts POST with a JSON body.
struct Router {
    static string_response route(request&& req, Dispatcher& dispatcher);

    static string_response makeJsonResponse(const request& req, const nlohmann::json& j,
                                            status s = status::ok);

    static string_response makeErrorResponse(const request& req, const std::string& msg,
                                             status s, const std::string& kind = "ProtocolError");
};

}
