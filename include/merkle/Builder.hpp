#pragma once

#include "merkle/Tree.hpp"
#include "fs/model/FileRecord.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace tl::fs { class Enumerator; }

namespace tl::merkle {

struct BuildResult {
    Tree tree;
    std::vector<fs::model::FileRecord> records;
    std::vector<fs::model::Reject> rejects;
};

class Builder {
public:
    // Enumerates root and builds its tree. Throws EnumerationError on an unusable root.
    static BuildResult build(const std::filesystem::path& root, const fs::Enumerator& enumerator);

    // Input order does not matter.
    static Tree fromRecords(const std::vector<fs::model::FileRecord>& records);

    // path -> hash. Throws SnapshotError on an invalid path or a file/directory collision.
    static Tree fromLeaves(const std::map<std::string, std::string>& leaves);
};

}
