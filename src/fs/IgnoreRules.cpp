#include "fs/IgnoreRules.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <fnmatch.h>
#include <fstream>

using namespace tl::fs;

const std::vector<std::string>& IgnoreRules::defaults() {
    static const std::vector<std::string> d{".env", ".gitignore", ".git", ".DS_Store"};
    return d;
}

IgnoreRules::IgnoreRules() {
    for (const auto& p : defaults()) add(p);
}

IgnoreRules::IgnoreRules(const std::vector<std::string>& patterns) : IgnoreRules() {
    for (const auto& p : patterns) add(p);
}

IgnoreRules IgnoreRules::forProject(const std::filesystem::path& root, const config::IgnoreConfig& cfg) {
    IgnoreRules rules(cfg.patterns);
    if (!cfg.file_name.empty()) rules.addFile(root / cfg.file_name);
    return rules;
}

static std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

void IgnoreRules::add(std::string_view pattern) {
    pattern = trim(pattern);
    if (pattern.empty() || pattern.front() == '#') return;

    Rule r;
    if (pattern.front() == '!') {
        r.negate = true;
        pattern.remove_prefix(1);
    }
    if (!pattern.empty() && pattern.back() == '/') {
        r.dirOnly = true;
        pattern.remove_suffix(1);
    }
    if (!pattern.empty() && pattern.front() == '/') {
        r.anchored = true;
        pattern.remove_prefix(1);
    }
    if (pattern.empty()) return;

    if (pattern.find('/') != std::string_view::npos) r.anchored = true;
    r.glob = std::string(pattern);
    rules_.push_back(std::move(r));
}

void IgnoreRules::addFile(const std::filesystem::path& file) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) return;

    std::ifstream in(file);
    if (!in) {
        log::Registry::fs()->warn("[IgnoreRules] Unable to read ignore file {}", file.string());
        return;
    }

    std::string line;
    while (std::getline(in, line)) add(line);
}

bool IgnoreRules::matchSelf(const std::string_view relPath, const bool isDirectory) const {
    const std::string full(relPath);
    const auto slash = relPath.rfind('/');
    const std::string name(slash == std::string_view::npos ? relPath : relPath.substr(slash + 1));

    bool ignored = false;
    for (const auto& r : rules_) {
        if (r.dirOnly && !isDirectory) continue;
        const int rc = r.anchored ? fnmatch(r.glob.c_str(), full.c_str(), FNM_PATHNAME)
                                  : fnmatch(r.glob.c_str(), name.c_str(), 0);
        if (rc == 0) ignored = !r.negate;
    }
    return ignored;
}

bool IgnoreRules::isIgnored(const std::string_view relPath, const bool isDirectory) const {
    for (size_t pos = relPath.find('/'); pos != std::string_view::npos; pos = relPath.find('/', pos + 1))
        if (matchSelf(relPath.substr(0, pos), true)) return true;
    return matchSelf(relPath, isDirectory);
}
