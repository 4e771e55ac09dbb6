#pragma once

#include "index/model/Chunk.hpp"

#include <ctime>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace tl::sync::model {

namespace reason {
inline constexpr std::string_view HashMismatch = "HashMismatch";
inline constexpr std::string_view NotInChangeSet = "NotInChangeSet";
inline constexpr std::string_view NotTransmitted = "NotTransmitted";
inline constexpr std::string_view EmbeddingProvider = "EmbeddingProviderError";
inline constexpr std::string_view IndexRejected = "IndexRejected";
}

struct PushItem {
    std::string path;
    std::string content;        // raw bytes; base64 on the wire
    std::string claimedHash;
};

struct Rejection {
    std::string path;
    std::string reason;

    [[nodiscard]] bool operator==(const Rejection&) const = default;
};

struct PushResult {
    std::vector<std::string> accepted;
    std::vector<Rejection> rejected;
    std::vector<index::model::Warning> warnings;
};

struct CommitResult {
    bool committed = false;
    std::string acknowledgedRootHash;
    bool upToDate = false;                  // acknowledged == client root
    std::vector<Rejection> rejected;        // final, including paths never transmitted
    std::vector<std::string> pendingRemovals;
};

struct Registration {
    std::string projectId;
    std::string name;
    std::time_t registeredAt{};
};

struct ProjectInfo {
    std::string projectId;
    std::string name;
    std::string rootHash;
    size_t fileCount{0};
    std::time_t registeredAt{};
    std::time_t lastSync{};                 // 0 => never
};

struct Health {
    std::string status = "ok";
    size_t projects{0};
    uint64_t uptimeSeconds{0};
};

void to_json(nlohmann::json& j, const PushItem& p);
void from_json(const nlohmann::json& j, PushItem& p);

void to_json(nlohmann::json& j, const Rejection& r);
void from_json(const nlohmann::json& j, Rejection& r);

void to_json(nlohmann::json& j, const PushResult& r);
void from_json(const nlohmann::json& j, PushResult& r);

void to_json(nlohmann::json& j, const CommitResult& r);
void from_json(const nlohmann::json& j, CommitResult& r);

void to_json(nlohmann::json& j, const Registration& r);
void from_json(const nlohmann::json& j, Registration& r);

void to_json(nlohmann::json& j, const ProjectInfo& p);
void from_json(const nlohmann::json& j, ProjectInfo& p);

void to_json(nlohmann::json& j, const Health& h);
void from_json(const nlohmann::json& j, Health& h);

}
