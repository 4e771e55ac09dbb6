#include "sync/model/Messages.hpp"
#include "crypto/util/encrypt.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <nlohmann/json.hpp>

using namespace tl::sync::model;
using nlohmann::json;

static std::string timeOrNull(const std::time_t t) {
    return t ? tl::util::timestampToString(t) : std::string{};
}

static std::time_t parseTimeOrZero(const json& j, const char* key) {
    if (!j.contains(key) || !j.at(key).is_string() || j.at(key).get<std::string>().empty()) return 0;
    return tl::util::parseTimestampFromString(j.at(key).get<std::string>());
}

void tl::sync::model::to_json(json& j, const PushItem& p) {
    j = {
        {"path", p.path},
        {"content", crypto::util::b64_encode(std::string_view(p.content))},
        {"claimedHash", p.claimedHash}
    };
}

void tl::sync::model::from_json(const json& j, PushItem& p) {
    j.at("path").get_to(p.path);
    j.at("claimedHash").get_to(p.claimedHash);
    try {
        const auto bytes = crypto::util::b64_decode(j.at("content").get<std::string>());
        p.content.assign(bytes.begin(), bytes.end());
    } catch (const std::invalid_argument&) {
        throw ProtocolError("Content of " + p.path + " is not valid base64");
    }
}

void tl::sync::model::to_json(json& j, const Rejection& r) {
    j = {{"path", r.path}, {"reason", r.reason}};
}

void tl::sync::model::from_json(const json& j, Rejection& r) {
    j.at("path").get_to(r.path);
    j.at("reason").get_to(r.reason);
}

void tl::sync::model::to_json(json& j, const PushResult& r) {
    j = {
        {"accepted", r.accepted},
        {"rejected", r.rejected},
        {"warnings", r.warnings}
    };
}

void tl::sync::model::from_json(const json& j, PushResult& r) {
    r.accepted = j.value("accepted", std::vector<std::string>{});
    r.rejected = j.value("rejected", std::vector<Rejection>{});
    r.warnings = j.value("warnings", std::vector<index::model::Warning>{});
}

void tl::sync::model::to_json(json& j, const CommitResult& r) {
    j = {
        {"committed", r.committed},
        {"acknowledgedRootHash", r.acknowledgedRootHash},
        {"upToDate", r.upToDate},
        {"rejected", r.rejected},
        {"pendingRemovals", r.pendingRemovals}
    };
}

void tl::sync::model::from_json(const json& j, CommitResult& r) {
    j.at("committed").get_to(r.committed);
    j.at("acknowledgedRootHash").get_to(r.acknowledgedRootHash);
    r.upToDate = j.value("upToDate", false);
    r.rejected = j.value("rejected", std::vector<Rejection>{});
    r.pendingRemovals = j.value("pendingRemovals", std::vector<std::string>{});
}

void tl::sync::model::to_json(json& j, const Registration& r) {
    j = {
        {"projectId", r.projectId},
        {"name", r.name},
        {"registeredAt", timeOrNull(r.registeredAt)}
    };
}

void tl::sync::model::from_json(const json& j, Registration& r) {
    j.at("projectId").get_to(r.projectId);
    r.name = j.value("name", std::string{});
    r.registeredAt = parseTimeOrZero(j, "registeredAt");
}

void tl::sync::model::to_json(json& j, const ProjectInfo& p) {
    j = {
        {"projectId", p.projectId},
        {"name", p.name},
        {"rootHash", p.rootHash},
        {"fileCount", p.fileCount},
        {"registeredAt", timeOrNull(p.registeredAt)},
        {"lastSync", p.lastSync ? json(util::timestampToString(p.lastSync)) : json(nullptr)}
    };
}

void tl::sync::model::from_json(const json& j, ProjectInfo& p) {
    j.at("projectId").get_to(p.projectId);
    p.name = j.value("name", std::string{});
    p.rootHash = j.value("rootHash", std::string{});
    p.fileCount = j.value("fileCount", size_t{0});
    p.registeredAt = parseTimeOrZero(j, "registeredAt");
    p.lastSync = parseTimeOrZero(j, "lastSync");
}

void tl::sync::model::to_json(json& j, const Health& h) {
    j = {
        {"status", h.status},
        {"projects", h.projects},
        {"uptimeSeconds", h.uptimeSeconds}
    };
}

void tl::sync::model::from_json(const json& j, Health& h) {
    j.at("status").get_to(h.status);
    h.projects = j.value("projects", size_t{0});
    h.uptimeSeconds = j.value("uptimeSeconds", uint64_t{0});
}
