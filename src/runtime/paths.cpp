#include "runtime/paths.hpp"

#include <cstdlib>
#include <unistd.h>

namespace tl::paths {

namespace {
std::filesystem::path testRoot_;

std::filesystem::path fromEnvOr(const char* var, const std::filesystem::path& def) {
    if (const char* v = std::getenv(var); v && *v) return v;
    return def;
}
}

std::filesystem::path getConfigPath() {
    return fromEnvOr("TREELINE_CONFIG", "/etc/treeline/config.yaml");
}

std::filesystem::path getLogPath() {
    if (testMode) return testRoot_ / "log";
    return fromEnvOr("TREELINE_LOG_DIR", "/var/log/treeline");
}

std::filesystem::path getStatePath() {
    if (testMode) return testRoot_ / "state";
    return fromEnvOr("TREELINE_STATE_DIR", "/var/lib/treeline");
}

void setPathsForTesting() {
    testMode = true;
    testRoot_ = std::filesystem::temp_directory_path() / ("treeline_test_" + std::to_string(::getpid()));
    std::filesystem::create_directories(testRoot_);
}

}
