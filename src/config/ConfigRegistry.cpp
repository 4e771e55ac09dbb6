#include "config/ConfigRegistry.hpp"

#include <stdexcept>
#include <spdlog/spdlog.h>

namespace tl::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        if (std::filesystem::exists(path)) config_ = loadConfig(path);
        else spdlog::warn("[ConfigRegistry] No config at {}, using defaults", path.string());
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config config) {
    std::call_once(init_flag_, [&]() {
        config_ = std::move(config);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace tl::config
