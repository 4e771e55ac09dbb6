#include "protocols/LoopbackTransport.hpp"
#include "protocols/Dispatcher.hpp"
#include "util/errors.hpp"

using namespace tl::protocols;
using nlohmann::json;

LoopbackTransport::LoopbackTransport(std::shared_ptr<Dispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher)) {}

json LoopbackTransport::call(const std::string_view op, const json& body) {
    if (interrupted()) throw CancelledError("Call to " + std::string(op) + " interrupted");

    const auto request = body.is_null() ? json() : json::parse(body.dump());
    auto res = dispatcher_->handle(op, request);
    auto out = json::parse(res.body.dump());

    if (res.status / 100 != 2)
        rethrowRemoteError(out.value("kind", std::string{}), out.value("error", std::string{}), res.status);

    return out;
}
