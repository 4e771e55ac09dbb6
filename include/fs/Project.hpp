#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tl::fs {

// Files or directories whose presence marks a project root.
const std::vector<std::string>& projectMarkers();

// Nearest ancestor of start (inclusive) containing a project marker; start itself if none.
std::filesystem::path detectProjectRoot(const std::filesystem::path& start = ".");

// Absolute, normalized root path. Used as project id when none is configured.
std::string defaultProjectId(const std::filesystem::path& root);

}
