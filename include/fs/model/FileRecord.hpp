#pragma once

#include <cstdint>
#include <ctime>
#include <string>

namespace tl::fs::model {

// One tracked file as seen by a single enumeration pass.
struct FileRecord {
    std::string path;           // relative, '/'-separated
    std::string contentHash;    // hex BLAKE2b-256 of the full content
    uintmax_t size{0};
    std::time_t modifiedTime{};

    [[nodiscard]] bool operator==(const FileRecord&) const = default;
};

struct Reject {
    std::string path;
    std::string reason;
};

}
