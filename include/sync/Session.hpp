#pragma once

#include "merkle/ChangeSet.hpp"
#include "merkle/Tree.hpp"
#include "index/model/EmbeddingRecord.hpp"
#include "index/model/Chunk.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace tl::sync {

// Server side of one cycle, from negotiate to commit. Holds hashes and ciphertext only.
struct Session {
    merkle::Tree clientSnapshot;
    merkle::Tree acknowledgedSnapshot;          // the server's snapshot when the cycle began
    merkle::ChangeSet pendingChangeSet;
    unsigned int retryCount{0};                 // re-pushes of an already-seen path

    std::map<std::string, std::vector<std::string>> stagedChunks;          // accepted path -> chunk hashes
    std::map<std::string, index::model::EmbeddingRecord> stagedRecords;    // chunk hash -> record
    std::map<std::string, std::string> rejected;                           // path -> reason
    std::set<std::string> removalsAcked;
    std::vector<index::model::Warning> warnings;

    [[nodiscard]] bool hasOutcome(const std::string& path) const {
        return stagedChunks.contains(path) || rejected.contains(path);
    }
};

}
