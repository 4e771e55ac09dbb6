#pragma once

#include "merkle/ChangeSet.hpp"
#include "sync/model/Messages.hpp"
#include "index/model/Chunk.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tl::sync {

enum class CycleStatus {
    UpToDate,       // probe matched, nothing exchanged
    Synced,         // every change accepted
    Partial,        // committed, some paths rejected or pending
    Degraded,       // retry budget exhausted, nothing committed
    Failed,         // fatal error, nothing committed
    Cancelled       // stopped mid-cycle, nothing committed
};

std::string_view to_string(CycleStatus s);

struct CycleReport {
    CycleStatus status = CycleStatus::Failed;
    std::string projectId;
    std::string rootHash;                   // client snapshot root
    std::string acknowledgedRootHash;       // server root after the cycle, empty if unknown
    merkle::ChangeSet changeSet;
    std::vector<std::string> accepted;
    std::vector<model::Rejection> rejected;
    std::vector<std::string> pendingRetry;  // retried by the next cycle
    std::vector<index::model::Warning> warnings;
    unsigned int retries{0};
    std::string error;
    std::string errorKind;

    // Only a cycle with nothing rejected or pending counts as success.
    [[nodiscard]] bool ok() const { return status == CycleStatus::UpToDate || status == CycleStatus::Synced; }

    [[nodiscard]] std::string summary() const;
};

}
