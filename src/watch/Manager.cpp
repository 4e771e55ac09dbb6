#include "watch/Manager.hpp"
#include "watch/InotifySource.hpp"
#include "fs/IgnoreRules.hpp"
#include "log/Registry.hpp"

#include <ranges>
#include <stdexcept>
#include <vector>

using namespace tl::watch;

ProjectConfig ProjectConfig::fromConfig(const config::Config& cfg, std::string projectId, std::filesystem::path root) {
    return {
        .projectId = std::move(projectId),
        .root = std::move(root),
        .watcher = {
            .debounce = std::chrono::milliseconds(cfg.sync.debounce_ms),
            .maxDebounce = std::chrono::milliseconds(cfg.sync.max_debounce_ms),
            .interval = std::chrono::seconds(cfg.sync.interval_seconds),
            .runOnStart = true,
        },
        .useInotify = cfg.sync.use_inotify,
        .ignore = cfg.ignore,
    };
}

Manager::~Manager() {
    stopAll();
}

Handle Manager::start(const ProjectConfig& project, CycleFn cycle) {
    std::unique_ptr<ChangeSource> source;
    if (project.useInotify)
        source = std::make_unique<InotifySource>(project.root, fs::IgnoreRules::forProject(project.root, project.ignore));

    auto watcher = std::make_shared<Watcher>(project.projectId, project.watcher, std::move(cycle), std::move(source));

    Handle handle;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& w : watchers_ | std::views::values)
            if (w->projectId() == project.projectId)
                throw std::invalid_argument("Project already watched: " + project.projectId);
        handle = nextHandle_++;
        watchers_.emplace(handle, watcher);
    }

    watcher->start();
    log::Registry::watch()->info("[Manager] Watching {} at {}", project.projectId, project.root.string());
    return handle;
}

void Manager::stop(const Handle handle) {
    std::shared_ptr<Watcher> watcher;
    {
        std::scoped_lock lock(mutex_);
        const auto it = watchers_.find(handle);
        if (it == watchers_.end()) return;
        watcher = std::move(it->second);
        watchers_.erase(it);
    }
    watcher->stop();
    log::Registry::watch()->info("[Manager] Stopped watching {}", watcher->projectId());
}

void Manager::stopAll() {
    std::vector<Handle> handles;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& h : watchers_ | std::views::keys) handles.push_back(h);
    }
    for (const auto h : handles) stop(h);
}

std::shared_ptr<Watcher> Manager::watcher(const Handle handle) const {
    std::scoped_lock lock(mutex_);
    const auto it = watchers_.find(handle);
    return it == watchers_.end() ? nullptr : it->second;
}

size_t Manager::size() const {
    std::scoped_lock lock(mutex_);
    return watchers_.size();
}
