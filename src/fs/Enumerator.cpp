#include "fs/Enumerator.hpp"
#include "concurrency/ThreadPool.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <future>

using namespace tl::fs;
using namespace tl::fs::model;

namespace stdfs = std::filesystem;

namespace {

struct Candidate {
    std::string rel;
    stdfs::path abs;
    uintmax_t size{};
    std::time_t mtime{};
};

std::time_t toTimeT(const stdfs::file_time_type ft) {
    const auto sys = std::chrono::file_clock::to_sys(ft);
    return std::chrono::system_clock::to_time_t(std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
}

std::string join(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + '/' + name;
}

}

Enumerator::Enumerator(IgnoreRules rules, std::shared_ptr<concurrency::ThreadPool> pool, HashFn hash)
    : rules_(std::move(rules)), pool_(std::move(pool)), hash_(std::move(hash)) {
    if (!hash_) hash_ = [](const stdfs::path& p) { return crypto::hash::blake2b(p); };
}

EnumerationResult Enumerator::enumerate(const stdfs::path& root) const {
    std::error_code ec;
    const auto st = stdfs::status(root, ec);
    if (ec || !stdfs::exists(st)) throw EnumerationError("Project root does not exist: " + root.string());
    if (!stdfs::is_directory(st)) throw EnumerationError("Project root is not a directory: " + root.string());

    EnumerationResult result;
    std::vector<Candidate> candidates;

    // depth-first, explicit stack
    std::vector<std::pair<stdfs::path, std::string>> stack{{root, ""}};
    while (!stack.empty()) {
        auto [dir, rel] = std::move(stack.back());
        stack.pop_back();

        stdfs::directory_iterator it(dir, ec);
        if (ec) {
            if (rel.empty()) throw EnumerationError("Project root is unreadable: " + root.string() + ": " + ec.message());
            log::Registry::fs()->warn("[Enumerator] Skipping unreadable directory {}: {}", rel, ec.message());
            result.rejects.push_back({rel, ec.message()});
            continue;
        }

        const stdfs::directory_iterator end{};
        for (; it != end; it.increment(ec)) {
            const auto& entry = *it;
            const auto name = entry.path().filename().string();
            const auto childRel = join(rel, name);

            std::error_code sec;
            const auto lst = entry.symlink_status(sec);
            if (sec) {
                result.rejects.push_back({childRel, sec.message()});
                continue;
            }
            if (stdfs::is_symlink(lst)) continue;

            if (stdfs::is_directory(lst)) {
                if (!rules_.isIgnored(childRel, true)) stack.emplace_back(entry.path(), childRel);
                continue;
            }

            if (!stdfs::is_regular_file(lst) || rules_.isIgnored(childRel, false)) continue;

            Candidate c{childRel, entry.path()};
            c.size = entry.file_size(sec);
            if (!sec) c.mtime = toTimeT(entry.last_write_time(sec));
            if (sec) {
                result.rejects.push_back({childRel, sec.message()});
                continue;
            }
            candidates.push_back(std::move(c));
        }

        if (ec) {
            log::Registry::fs()->warn("[Enumerator] Listing of {} aborted: {}", rel.empty() ? "." : rel, ec.message());
            result.rejects.push_back({rel.empty() ? "." : rel, ec.message()});
            ec.clear();
        }
    }

    const auto addRecord = [&result](const Candidate& c, std::string hash) {
        result.records.push_back({c.rel, std::move(hash), c.size, c.mtime});
    };

    if (pool_) {
        std::vector<std::future<std::string>> futures;
        futures.reserve(candidates.size());
        for (const auto& c : candidates)
            futures.push_back(pool_->submit([this, p = c.abs] { return hash_(p); }));

        for (size_t i = 0; i < candidates.size(); ++i) {
            try {
                addRecord(candidates[i], futures[i].get());
            } catch (const std::exception& e) {
                log::Registry::fs()->warn("[Enumerator] {}", e.what());
                result.rejects.push_back({candidates[i].rel, e.what()});
            }
        }
    } else {
        for (const auto& c : candidates) {
            try {
                addRecord(c, hash_(c.abs));
            } catch (const std::exception& e) {
                log::Registry::fs()->warn("[Enumerator] {}", e.what());
                result.rejects.push_back({c.rel, e.what()});
            }
        }
    }

    std::ranges::sort(result.records, {}, &FileRecord::path);
    std::ranges::sort(result.rejects, {}, &Reject::path);

    log::Registry::fs()->debug("[Enumerator] {}: {} files, {} rejects", root.string(),
                               result.records.size(), result.rejects.size());
    return result;
}
