#pragma once

#include "watch/ChangeSource.hpp"
#include "fs/IgnoreRules.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace tl::watch {

/**
 * Recursive inotify watch over a project root.
 *
 * Every non-ignored directory gets its own watch; directories created or
 * moved in later are armed as they appear. Events on ignored paths are
 * dropped before reaching the callback.
 */
class InotifySource final : public ChangeSource {
public:
    InotifySource(std::filesystem::path root, fs::IgnoreRules ignore);
    ~InotifySource() override;

    InotifySource(const InotifySource&) = delete;
    InotifySource& operator=(const InotifySource&) = delete;

    // Throws std::system_error if inotify cannot be initialised.
    void start(Callback onChange) override;
    void stop() override;

    [[nodiscard]] size_t watchCount() const;

private:
    std::filesystem::path root_;
    fs::IgnoreRules ignore_;
    Callback onChange_;

    int inotifyFd_ = -1;
    int wakeFd_ = -1;
    std::thread reader_;
    std::atomic<bool> running_{false};

    mutable std::mutex mutex_;
    std::unordered_map<int, std::string> dirs_;     // wd -> path relative to root, "" for root

    void armRecursive(const std::string& rel);
    void arm(const std::string& rel);
    void readLoop();
    void closeFds();
};

}
