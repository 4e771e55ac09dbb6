#pragma once

#include "watch/Watcher.hpp"
#include "config/Config.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace tl::watch {

struct ProjectConfig {
    std::string projectId;
    std::filesystem::path root;
    WatcherOptions watcher;
    bool useInotify = true;
    config::IgnoreConfig ignore;

    static ProjectConfig fromConfig(const config::Config& cfg, std::string projectId, std::filesystem::path root);
};

using Handle = uint64_t;

/**
 * Owns one Watcher per project. At most one watcher, and so at most one
 * cycle in flight, per project id.
 */
class Manager {
public:
    Manager() = default;
    ~Manager();

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Throws std::invalid_argument if the project is already watched.
    Handle start(const ProjectConfig& project, CycleFn cycle);

    // Unknown handles are ignored.
    void stop(Handle handle);

    void stopAll();

    [[nodiscard]] std::shared_ptr<Watcher> watcher(Handle handle) const;
    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<Handle, std::shared_ptr<Watcher>> watchers_;
    Handle nextHandle_{1};
};

}
