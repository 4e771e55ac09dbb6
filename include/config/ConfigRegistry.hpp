#pragma once

#include "config/Config.hpp"

#include <mutex>
#include "runtime/paths.hpp"

namespace tl::config {

class ConfigRegistry {
public:
    // Loads from path; a missing file leaves every section at its defaults.
    static void init(const std::filesystem::path& path = paths::getConfigPath());
    static void init(Config config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace tl::config
