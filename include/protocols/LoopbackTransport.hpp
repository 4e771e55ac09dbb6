#pragma once

#include "protocols/Transport.hpp"

#include <memory>

namespace tl::protocols {

class Dispatcher;

// In-process transport. Bodies are still serialized, so the wire encoding is exercised.
class LoopbackTransport : public Transport {
public:
    explicit LoopbackTransport(std::shared_ptr<Dispatcher> dispatcher);

    nlohmann::json call(std::string_view op, const nlohmann::json& body) override;

private:
    std::shared_ptr<Dispatcher> dispatcher_;
};

}
