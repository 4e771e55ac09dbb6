#include "sync/CycleReport.hpp"

#include <fmt/format.h>

using namespace tl::sync;

std::string_view tl::sync::to_string(const CycleStatus s) {
    switch (s) {
        case CycleStatus::UpToDate: return "UpToDate";
        case CycleStatus::Synced: return "Synced";
        case CycleStatus::Partial: return "Partial";
        case CycleStatus::Degraded: return "Degraded";
        case CycleStatus::Failed: return "Failed";
        case CycleStatus::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

std::string CycleReport::summary() const {
    auto s = fmt::format("{} [{}] root {}: +{} ~{} -{}, accepted {}, rejected {}, pending {}, warnings {}",
                         projectId, to_string(status), rootHash.empty() ? "-" : rootHash.substr(0, 12),
                         changeSet.added.size(), changeSet.modified.size(), changeSet.removed.size(),
                         accepted.size(), rejected.size(), pendingRetry.size(), warnings.size());
    if (retries) s += fmt::format(", {} retries", retries);
    if (!error.empty()) s += fmt::format(" ({}: {})", errorKind, error);
    return s;
}
