#pragma once

#include "sync/Session.hpp"
#include "sync/StateStore.hpp"
#include "sync/model/Messages.hpp"
#include "index/VectorIndex.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tl::index { class Pipeline; }

namespace tl::sync {

/**
 * Server role of the sync protocol.
 *
 * Owns every project's acknowledged snapshot, chunk references and vector
 * index. Requests for one project are serialized on that project's mutex;
 * different projects proceed independently. commit() is the only writer
 * of acknowledged state.
 */
class Server {
public:
    Server(std::shared_ptr<StateStore> store,
           std::shared_ptr<index::Pipeline> pipeline,
           index::VectorIndexFactory indexFactory);

    model::Registration registerProject(const std::string& projectId, const std::string& name);

    [[nodiscard]] bool probe(const std::string& projectId, const std::string& rootHash);

    // Opens a session, replacing any unfinished one. Computes the canonical diff.
    merkle::ChangeSet negotiate(const std::string& projectId, merkle::Tree clientSnapshot);

    // Per-item verification; a bad item never aborts the batch.
    model::PushResult pushChanges(const std::string& projectId, std::vector<model::PushItem> items);

    bool pushRemovals(const std::string& projectId, const std::vector<std::string>& paths);

    // rootHash must be the negotiated client root. Repeating the last commit returns its result again.
    model::CommitResult commit(const std::string& projectId, const std::string& rootHash);

    [[nodiscard]] model::Health health();

    [[nodiscard]] std::vector<model::ProjectInfo> listProjects();

    // External-store role: records addressed directly by chunk hash.
    [[nodiscard]] index::VectorIndex& store();

    [[nodiscard]] const index::Pipeline& pipeline() const { return *pipeline_; }

    [[nodiscard]] std::string acknowledgedRootHash(const std::string& projectId);
    [[nodiscard]] std::optional<std::vector<std::string>> chunksFor(const std::string& projectId, const std::string& path);
    [[nodiscard]] std::shared_ptr<index::VectorIndex> vectorIndex(const std::string& projectId);
    [[nodiscard]] bool hasSession(const std::string& projectId);

private:
    struct Project {
        std::mutex mutex;
        PersistedProject state;
        bool registered = false;
        std::shared_ptr<index::VectorIndex> index;
        std::optional<Session> session;

        struct LastCommit {
            std::string clientRoot;
            model::CommitResult result;
        };
        std::optional<LastCommit> lastCommit;
    };

    std::shared_ptr<StateStore> store_;
    std::shared_ptr<index::Pipeline> pipeline_;
    index::VectorIndexFactory indexFactory_;
    std::chrono::steady_clock::time_point startedAt_;

    std::mutex projectsMutex_;
    std::map<std::string, std::shared_ptr<Project>> projects_;

    std::mutex storeMutex_;
    std::shared_ptr<index::VectorIndex> sharedStore_;

    // Loads lazily from the state store. Unknown ids yield an unregistered, empty project.
    std::shared_ptr<Project> project(const std::string& projectId);

    static Session& requireSession(Project& p, const std::string& projectId);
};

}
