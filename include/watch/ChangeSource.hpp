#pragma once

#include <functional>

namespace tl::watch {

// Push-style filesystem event feed. onChange may be called from any thread.
class ChangeSource {
public:
    using Callback = std::function<void()>;

    virtual ~ChangeSource() = default;

    virtual void start(Callback onChange) = 0;
    virtual void stop() = 0;
};

}
