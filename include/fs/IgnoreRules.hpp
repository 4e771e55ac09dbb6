#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tl::config { struct IgnoreConfig; }

namespace tl::fs {

/**
 * Gitignore-flavoured path filter.
 *
 * One fnmatch glob per pattern. A pattern without '/' matches any path
 * component by name; one containing '/' matches the whole relative path.
 * A trailing '/' restricts the pattern to directories, a leading '!'
 * re-includes. The last matching pattern wins.
 */
class IgnoreRules {
public:
    // Always present, before any configured pattern.
    static const std::vector<std::string>& defaults();

    IgnoreRules();

    explicit IgnoreRules(const std::vector<std::string>& patterns);

    // defaults + cfg.patterns + the project's ignore file, if present
    static IgnoreRules forProject(const std::filesystem::path& root, const config::IgnoreConfig& cfg);

    void add(std::string_view pattern);

    // Missing file is not an error.
    void addFile(const std::filesystem::path& file);

    // Ancestors of relPath are checked as directories first.
    [[nodiscard]] bool isIgnored(std::string_view relPath, bool isDirectory) const;

    [[nodiscard]] size_t size() const { return rules_.size(); }

private:
    struct Rule {
        std::string glob;
        bool negate = false;
        bool dirOnly = false;
        bool anchored = false;
    };

    std::vector<Rule> rules_;

    [[nodiscard]] bool matchSelf(std::string_view relPath, bool isDirectory) const;
};

}
