#include "protocols/Dispatcher.hpp"
#include "sync/Server.hpp"
#include "merkle/Snapshot.hpp"
#include "index/Pipeline.hpp"
#include "crypto/KeyRing.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"

using namespace tl::protocols;
using namespace tl::sync::model;
using nlohmann::json;

namespace {

struct UnknownOp : std::runtime_error {
    using std::runtime_error::runtime_error;
};

json errorBody(const std::string& message, const std::string_view kind) {
    return {{"error", message}, {"kind", kind}};
}

std::string requireString(const json& body, const char* key) {
    if (!body.is_object() || !body.contains(key) || !body.at(key).is_string())
        throw tl::ProtocolError(std::string("Missing or non-string field '") + key + "'");
    return body.at(key).get<std::string>();
}

}

Dispatcher::Dispatcher(std::shared_ptr<sync::Server> server) : server_(std::move(server)) {}

json Dispatcher::dispatch(const std::string_view op, const json& body) {
    auto& s = *server_;

    if (op == "health") return s.health();
    if (op == "projects") return s.listProjects();

    if (op == "register")
        return s.registerProject(requireString(body, "projectId"), body.value("name", std::string{}));

    if (op == "probe")
        return {{"upToDate", s.probe(requireString(body, "projectId"), requireString(body, "rootHash"))}};

    if (op == "negotiate") {
        auto tree = merkle::deserialize(body.at("treeSnapshot"));
        return {{"changedPaths", s.negotiate(requireString(body, "projectId"), std::move(tree))}};
    }

    if (op == "pushChanges")
        return s.pushChanges(requireString(body, "projectId"), body.at("items").get<std::vector<PushItem>>());

    if (op == "pushRemovals")
        return {{"ack", s.pushRemovals(requireString(body, "projectId"), body.at("paths").get<std::vector<std::string>>())}};

    if (op == "commit")
        return s.commit(requireString(body, "projectId"), requireString(body, "rootHash"));

    if (op == "upsertEmbedding") {
        const bool stored = s.store().upsert(body.get<index::model::EmbeddingRecord>());
        s.store().flush();
        return {{"stored", stored}};
    }

    if (op == "deleteEmbedding") {
        s.store().erase(requireString(body, "chunkHash"));
        s.store().flush();
        return {{"ack", true}};
    }

    if (op == "getEmbedding") {
        const auto rec = s.store().get(requireString(body, "chunkHash"));
        if (!rec) return {{"found", false}};
        return {{"found", true}, {"record", *rec}};
    }

    if (op == "queryEmbeddings") {
        const auto& keys = s.pipeline().keys();
        if (requireString(body, "keyId") != keys.keyId())
            throw ProtocolError("Store does not hold key " + body.at("keyId").get<std::string>());
        json hits = json::array();
        for (const auto& [hash, score] : s.store().query(body.at("vector").get<std::vector<float>>(),
                                                         body.at("k").get<size_t>(), keys))
            hits.push_back({{"chunkHash", hash}, {"score", score}});
        return {{"hits", hits}};
    }

    throw UnknownOp("Unknown operation: " + std::string(op));
}

Response Dispatcher::handle(const std::string_view op, const json& body) {
    try {
        return {200, dispatch(op, body)};
    } catch (const UnknownOp& e) {
        return {404, errorBody(e.what(), "ProtocolError")};
    } catch (const ProtocolError& e) {
        log::Registry::sync()->warn("[Dispatcher] {} rejected: {}", op, e.what());
        return {400, errorBody(e.what(), e.kind())};
    } catch (const SnapshotError& e) {
        log::Registry::sync()->warn("[Dispatcher] {} rejected snapshot: {}", op, e.what());
        return {400, errorBody(e.what(), e.kind())};
    } catch (const json::exception& e) {
        log::Registry::sync()->warn("[Dispatcher] {} malformed request: {}", op, e.what());
        return {400, errorBody(std::string("Malformed request: ") + e.what(), "ProtocolError")};
    } catch (const Error& e) {
        log::Registry::sync()->error("[Dispatcher] {} failed: {}: {}", op, e.kind(), e.what());
        return {500, errorBody(e.what(), e.kind())};
    } catch (const std::exception& e) {
        log::Registry::sync()->error("[Dispatcher] {} failed: {}", op, e.what());
        return {500, errorBody(e.what(), "Error")};
    }
}
