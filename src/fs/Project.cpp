#include "fs/Project.hpp"

using namespace tl::fs;

namespace stdfs = std::filesystem;

const std::vector<std::string>& tl::fs::projectMarkers() {
    static const std::vector<std::string> markers{
        ".git", "pyproject.toml", "package.json", "Cargo.toml", "go.mod",
        "pom.xml", "build.gradle", "requirements.txt", "setup.py"
    };
    return markers;
}

stdfs::path tl::fs::detectProjectRoot(const stdfs::path& start) {
    std::error_code ec;
    auto begin = stdfs::weakly_canonical(stdfs::absolute(start, ec), ec);
    if (ec) begin = stdfs::absolute(start).lexically_normal();

    for (auto dir = begin;; dir = dir.parent_path()) {
        for (const auto& m : projectMarkers())
            if (stdfs::exists(dir / m, ec)) return dir;
        if (dir == dir.parent_path()) break;
    }
    return begin;
}

std::string tl::fs::defaultProjectId(const stdfs::path& root) {
    std::error_code ec;
    auto p = stdfs::weakly_canonical(stdfs::absolute(root, ec), ec);
    if (ec) p = stdfs::absolute(root).lexically_normal();
    auto s = p.string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}
