#include "watch/InotifySource.hpp"
#include "log/Registry.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

using namespace tl::watch;
namespace stdfs = std::filesystem;

namespace {

constexpr uint32_t WATCH_MASK = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM |
                                IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF | IN_ONLYDIR;

std::string join(const std::string& dir, const std::string_view name) {
    if (dir.empty()) return std::string(name);
    return dir + "/" + std::string(name);
}

}

InotifySource::InotifySource(stdfs::path root, fs::IgnoreRules ignore)
    : root_(std::move(root)), ignore_(std::move(ignore)) {}

InotifySource::~InotifySource() {
    stop();
}

void InotifySource::start(Callback onChange) {
    if (running_.load()) return;
    onChange_ = std::move(onChange);

    inotifyFd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotifyFd_ < 0) throw std::system_error(errno, std::generic_category(), "inotify_init1");

    wakeFd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (wakeFd_ < 0) {
        const int err = errno;
        closeFds();
        throw std::system_error(err, std::generic_category(), "eventfd");
    }

    armRecursive("");

    running_.store(true);
    reader_ = std::thread([this] {
        try {
            readLoop();
        } catch (const std::exception& e) {
            log::Registry::watch()->error("[InotifySource] Reader for {} stopped: {}", root_.string(), e.what());
        }
    });

    log::Registry::watch()->debug("[InotifySource] Watching {} ({} directories)", root_.string(), watchCount());
}

void InotifySource::stop() {
    if (!running_.exchange(false)) return;

    const uint64_t one = 1;
    if (::write(wakeFd_, &one, sizeof(one)) < 0)
        log::Registry::watch()->warn("[InotifySource] Failed to wake reader: {}", std::strerror(errno));

    if (reader_.joinable()) reader_.join();
    closeFds();

    std::scoped_lock lock(mutex_);
    dirs_.clear();
}

size_t InotifySource::watchCount() const {
    std::scoped_lock lock(mutex_);
    return dirs_.size();
}

void InotifySource::closeFds() {
    if (inotifyFd_ >= 0) ::close(inotifyFd_);
    if (wakeFd_ >= 0) ::close(wakeFd_);
    inotifyFd_ = wakeFd_ = -1;
}

void InotifySource::arm(const std::string& rel) {
    const auto full = rel.empty() ? root_ : root_ / rel;
    const int wd = ::inotify_add_watch(inotifyFd_, full.c_str(), WATCH_MASK);
    if (wd < 0) {
        // ENOSPC: fs.inotify.max_user_watches exhausted; the periodic timer still covers this subtree
        log::Registry::watch()->warn("[InotifySource] Cannot watch {}: {}", full.string(), std::strerror(errno));
        return;
    }
    std::scoped_lock lock(mutex_);
    dirs_[wd] = rel;
}

void InotifySource::armRecursive(const std::string& rel) {
    arm(rel);

    const auto base = rel.empty() ? root_ : root_ / rel;
    std::error_code ec;
    auto it = stdfs::recursive_directory_iterator(base, stdfs::directory_options::skip_permission_denied, ec);
    if (ec) {
        log::Registry::watch()->warn("[InotifySource] Cannot list {}: {}", base.string(), ec.message());
        return;
    }

    const stdfs::recursive_directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) break;
        if (it->is_symlink(ec) || !it->is_directory(ec)) continue;

        const auto childRel = stdfs::relative(it->path(), root_, ec).generic_string();
        if (ec) continue;
        if (ignore_.isIgnored(childRel, true)) {
            it.disable_recursion_pending();
            continue;
        }
        arm(childRel);
    }
}

void InotifySource::readLoop() {
    alignas(inotify_event) std::array<char, 64 * 1024> buf{};
    std::array<pollfd, 2> fds{{{inotifyFd_, POLLIN, 0}, {wakeFd_, POLLIN, 0}}};

    while (running_.load()) {
        if (::poll(fds.data(), fds.size(), -1) < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "poll");
        }
        if (fds[1].revents & POLLIN) break;
        if (!(fds[0].revents & POLLIN)) continue;

        const auto len = ::read(inotifyFd_, buf.data(), buf.size());
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            throw std::system_error(errno, std::generic_category(), "read(inotify)");
        }

        bool relevant = false;
        for (ssize_t off = 0; off < len;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf.data() + off);
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);

            if (ev->mask & IN_Q_OVERFLOW) {
                log::Registry::watch()->warn("[InotifySource] Event queue overflow under {}", root_.string());
                relevant = true;
                continue;
            }

            std::string dir;
            {
                std::scoped_lock lock(mutex_);
                const auto found = dirs_.find(ev->wd);
                if (found == dirs_.end()) continue;
                if (ev->mask & IN_IGNORED) {
                    dirs_.erase(found);
                    continue;
                }
                dir = found->second;
            }

            if (ev->len == 0) {
                relevant = true;    // the watched directory itself moved or vanished
                continue;
            }

            const bool isDir = ev->mask & IN_ISDIR;
            const auto rel = join(dir, ev->name);
            if (ignore_.isIgnored(rel, isDir)) continue;

            if (isDir && (ev->mask & (IN_CREATE | IN_MOVED_TO))) armRecursive(rel);
            relevant = true;
        }

        if (relevant && onChange_) onChange_();
    }
}
