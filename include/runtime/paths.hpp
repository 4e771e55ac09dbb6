#pragma once

#include <filesystem>

namespace tl::paths {

inline bool testMode = false;

std::filesystem::path getConfigPath();
std::filesystem::path getLogPath();
std::filesystem::path getStatePath();

// Redirects log and state paths under a scratch directory.
void setPathsForTesting();

}
