#pragma once

#include "fs/IgnoreRules.hpp"
#include "fs/model/FileRecord.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <vector>

namespace tl::concurrency { class ThreadPool; }

namespace tl::fs {

struct EnumerationResult {
    std::vector<model::FileRecord> records;     // sorted by path
    std::vector<model::Reject> rejects;         // unreadable files or directories
};

class Enumerator {
public:
    // Content hash of one file. A throw turns the file into a reject.
    using HashFn = std::function<std::string(const std::filesystem::path&)>;

    explicit Enumerator(IgnoreRules rules, std::shared_ptr<concurrency::ThreadPool> pool = nullptr,
                        HashFn hash = nullptr);

    // Throws EnumerationError if root is missing, not a directory or unreadable.
    [[nodiscard]] EnumerationResult enumerate(const std::filesystem::path& root) const;

    [[nodiscard]] const IgnoreRules& rules() const { return rules_; }

private:
    IgnoreRules rules_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    HashFn hash_;
};

}
