#include "sync/Server.hpp"
#include "merkle/Builder.hpp"
#include "merkle/Differ.hpp"
#include "index/Pipeline.hpp"
#include "index/FileVectorIndex.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/timestamp.hpp"

#include <fmt/format.h>
#include <set>

using namespace tl::sync;
using namespace tl::sync::model;

Server::Server(std::shared_ptr<StateStore> store,
               std::shared_ptr<index::Pipeline> pipeline,
               index::VectorIndexFactory indexFactory)
    : store_(std::move(store)),
      pipeline_(std::move(pipeline)),
      indexFactory_(std::move(indexFactory)),
      startedAt_(std::chrono::steady_clock::now()) {
    if (!store_ || !pipeline_ || !indexFactory_) throw std::invalid_argument("Server requires a store, pipeline and index factory");
}

std::shared_ptr<Server::Project> Server::project(const std::string& projectId) {
    if (projectId.empty()) throw ProtocolError("Missing projectId");

    std::scoped_lock lock(projectsMutex_);
    if (const auto it = projects_.find(projectId); it != projects_.end()) return it->second;

    auto p = std::make_shared<Project>();
    if (auto persisted = store_->load(projectId)) {
        p->state = std::move(*persisted);
        p->registered = true;
    } else {
        p->state.projectId = projectId;
    }
    p->index = indexFactory_(store_->projectDir(projectId));
    projects_.emplace(projectId, p);
    return p;
}

Session& Server::requireSession(Project& p, const std::string& projectId) {
    if (!p.session) throw ProtocolError("No open sync session for project " + projectId);
    return *p.session;
}

Registration Server::registerProject(const std::string& projectId, const std::string& name) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);

    if (!p->registered) {
        p->state.name = name.empty() ? projectId : name;
        p->state.registeredAt = util::now();
        store_->save(p->state);
        p->registered = true;
        log::Registry::audit()->info("[Server] Registered project {} ({})", projectId, p->state.name);
        log::Registry::sync()->info("[Server] Registered project {} ({})", projectId, p->state.name);
    } else if (!name.empty() && name != p->state.name) {
        p->state.name = name;
        store_->save(p->state);
    }

    return {projectId, p->state.name, p->state.registeredAt};
}

bool Server::probe(const std::string& projectId, const std::string& rootHash) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    return p->registered && p->state.tree.rootHash() == rootHash;
}

tl::merkle::ChangeSet Server::negotiate(const std::string& projectId, merkle::Tree clientSnapshot) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);

    if (!p->registered) throw ProtocolError("Project " + projectId + " is not registered");

    if (p->session)
        log::Registry::sync()->warn("[Server] Discarding unfinished session for {}", projectId);

    merkle::DiffStats stats;
    auto changes = merkle::Differ::diff(p->state.tree, clientSnapshot, &stats);

    log::Registry::sync()->info("[Server] {}: negotiated {} -> {}: +{} ~{} -{} ({} nodes visited)",
                                projectId, p->state.tree.rootHash(), clientSnapshot.rootHash(),
                                changes.added.size(), changes.modified.size(), changes.removed.size(),
                                stats.nodesVisited);

    p->lastCommit.reset();
    p->session.emplace();
    p->session->acknowledgedSnapshot = p->state.tree;
    p->session->clientSnapshot = std::move(clientSnapshot);
    p->session->pendingChangeSet = changes;
    return changes;
}

PushResult Server::pushChanges(const std::string& projectId, std::vector<PushItem> items) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    auto& s = requireSession(*p, projectId);

    PushResult out;
    const auto reject = [&](const std::string& path, const std::string_view reason) {
        s.rejected[path] = std::string(reason);
        out.rejected.push_back({path, std::string(reason)});
    };

    for (auto& item : items) {
        if (!merkle::isValidPath(item.path) || !s.pendingChangeSet.needsContent(item.path)) {
            log::Registry::sync()->warn("[Server] {}: {} is not in the negotiated change-set", projectId, item.path);
            out.rejected.push_back({item.path, std::string(reason::NotInChangeSet)});
            continue;
        }

        if (s.hasOutcome(item.path)) {
            ++s.retryCount;
            s.stagedChunks.erase(item.path);
            s.rejected.erase(item.path);
        }

        const auto actual = crypto::hash::blake2b(item.content);
        const auto expected = s.clientSnapshot.leafHash(item.path);
        if (actual != item.claimedHash || !expected || actual != *expected) {
            const HashMismatchError err(fmt::format("{}: received {}, claimed {}", item.path, actual, item.claimedHash));
            log::Registry::sync()->warn("[Server] {}: {}", projectId, err.what());
            reject(item.path, reason::HashMismatch);
            continue;
        }

        try {
            auto outcome = pipeline_->process(item.path, item.content, [&](const std::string& h) {
                return s.stagedRecords.contains(h) || p->index->contains(h);
            });

            for (auto& rec : outcome.records) {
                auto key = rec.chunkHash;
                s.stagedRecords.insert_or_assign(std::move(key), std::move(rec));
            }
            s.stagedChunks[item.path] = std::move(outcome.chunkHashes);
            for (auto& w : outcome.warnings) {
                s.warnings.push_back(w);
                out.warnings.push_back(std::move(w));
            }
            out.accepted.push_back(item.path);
        } catch (const EmbeddingProviderError& e) {
            log::Registry::embed()->warn("[Server] {}: embedding failed for {}: {}", projectId, item.path, e.what());
            reject(item.path, reason::EmbeddingProvider);
            out.warnings.push_back({item.path, std::string(e.kind()), e.what()});
        } catch (const EncryptionError& e) {
            log::Registry::crypto()->error("[Server] {}: aborting cycle, encryption failed for {}: {}",
                                           projectId, item.path, e.what());
            p->session.reset();
            throw;
        }

        // plaintext does not outlive the request
        std::string().swap(item.content);
    }

    log::Registry::sync()->debug("[Server] {}: push accepted {}, rejected {}", projectId,
                                 out.accepted.size(), out.rejected.size());
    return out;
}

bool Server::pushRemovals(const std::string& projectId, const std::vector<std::string>& paths) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    auto& s = requireSession(*p, projectId);

    bool all = true;
    for (const auto& path : paths) {
        if (s.pendingChangeSet.removed.contains(path)) s.removalsAcked.insert(path);
        else {
            log::Registry::sync()->warn("[Server] {}: removal of {} was not negotiated", projectId, path);
            all = false;
        }
    }
    return all;
}

// Whether inserting path as a file would clash with an existing directory or file ancestor.
static bool collides(const std::map<std::string, std::string>& leaves, const std::string& path) {
    const auto prefix = path + '/';
    if (const auto it = leaves.lower_bound(prefix); it != leaves.end() && it->first.starts_with(prefix)) return true;
    for (auto pos = path.find('/'); pos != std::string::npos; pos = path.find('/', pos + 1))
        if (leaves.contains(path.substr(0, pos))) return true;
    return false;
}

static std::set<std::string> referenced(const std::map<std::string, std::vector<std::string>>& chunks) {
    std::set<std::string> out;
    for (const auto& [_, hashes] : chunks) out.insert(hashes.begin(), hashes.end());
    return out;
}

CommitResult Server::commit(const std::string& projectId, const std::string& rootHash) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);

    // a client whose commit response was lost asks again for the same root
    if (!p->session && p->lastCommit && p->lastCommit->clientRoot == rootHash) {
        log::Registry::sync()->info("[Server] {}: replaying commit result for root {}", projectId, rootHash);
        return p->lastCommit->result;
    }

    auto& s = requireSession(*p, projectId);

    if (rootHash != s.clientSnapshot.rootHash())
        throw ProtocolError(fmt::format("Commit for {} names root {}, session negotiated {}",
                                        projectId, rootHash, s.clientSnapshot.rootHash()));

    const auto& changes = s.pendingChangeSet;
    for (const auto* set : {&changes.added, &changes.modified})
        for (const auto& path : *set)
            if (!s.hasOutcome(path)) s.rejected[path] = std::string(reason::NotTransmitted);

    // records reach the index before the snapshot names them; a path with a refused record is rejected
    std::set<std::string> upserted;
    for (const auto& [path, hashes] : s.stagedChunks) {
        if (s.rejected.contains(path)) continue;
        for (const auto& hash : hashes) {
            if (upserted.contains(hash) || p->index->contains(hash)) continue;
            const auto rec = s.stagedRecords.find(hash);
            if (rec == s.stagedRecords.end()) continue;
            if (!p->index->upsert(rec->second)) {
                log::Registry::index()->warn("[Server] {}: index refused chunk {} of {}", projectId, hash, path);
                s.rejected[path] = std::string(reason::IndexRejected);
                break;
            }
            upserted.insert(hash);
        }
    }
    p->index->flush();

    auto leaves = s.clientSnapshot.leaves();
    const auto previous = s.acknowledgedSnapshot.leaves();
    auto chunks = p->state.chunks;

    // rejected paths fall back to what was acknowledged before, so they show up in the next diff
    for (const auto& [path, _] : s.rejected) {
        if (const auto it = previous.find(path); it != previous.end()) leaves[path] = it->second;
        else leaves.erase(path);
    }

    CommitResult result;
    for (const auto& path : changes.removed) {
        if (!s.removalsAcked.contains(path) && !collides(leaves, path)) {
            leaves[path] = previous.at(path);
            result.pendingRemovals.push_back(path);
        } else {
            chunks.erase(path);
        }
    }

    for (auto& [path, hashes] : s.stagedChunks)
        if (!s.rejected.contains(path)) chunks[path] = hashes;
    std::erase_if(chunks, [&](const auto& kv) { return !leaves.contains(kv.first); });

    auto tree = merkle::Builder::fromLeaves(leaves);
    const auto nowRefs = referenced(chunks);
    auto stale = referenced(p->state.chunks);
    stale.insert(upserted.begin(), upserted.end());
    std::erase_if(stale, [&](const std::string& h) { return nowRefs.contains(h); });

    PersistedProject next = p->state;
    next.tree = std::move(tree);
    next.chunks = std::move(chunks);
    next.lastSync = util::now();
    store_->save(next);
    p->state = std::move(next);

    size_t evicted = 0;
    try {
        for (const auto& hash : stale) {
            p->index->erase(hash);
            ++evicted;
        }
        p->index->flush();
    } catch (const TransientNetworkError& e) {
        log::Registry::index()->warn("[Server] {}: eviction incomplete, orphaned records remain: {}", projectId, e.what());
    }

    for (const auto& [path, why] : s.rejected) result.rejected.push_back({path, why});
    result.committed = true;
    result.acknowledgedRootHash = p->state.tree.rootHash();
    result.upToDate = result.acknowledgedRootHash == s.clientSnapshot.rootHash();

    log::Registry::audit()->info("[Server] Committed {} at root {}: {} staged, {} upserted, {} evicted, {} rejected",
                                 projectId, result.acknowledgedRootHash, s.stagedChunks.size(), upserted.size(), evicted,
                                 result.rejected.size());
    log::Registry::sync()->info("[Server] {}: committed root {} ({} rejected, {} removals pending)", projectId,
                                result.acknowledgedRootHash, result.rejected.size(), result.pendingRemovals.size());

    p->lastCommit = Project::LastCommit{s.clientSnapshot.rootHash(), result};
    p->session.reset();
    return result;
}

Health Server::health() {
    Health h;
    h.projects = store_->list().size();
    h.uptimeSeconds = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startedAt_).count());
    return h;
}

std::vector<ProjectInfo> Server::listProjects() {
    std::vector<ProjectInfo> out;
    for (const auto& id : store_->list()) {
        const auto p = project(id);
        std::scoped_lock lock(p->mutex);
        out.push_back({id, p->state.name, p->state.tree.rootHash(), p->state.tree.leaves().size(),
                       p->state.registeredAt, p->state.lastSync});
    }
    return out;
}

tl::index::VectorIndex& Server::store() {
    std::scoped_lock lock(storeMutex_);
    if (!sharedStore_) sharedStore_ = std::make_shared<index::FileVectorIndex>(store_->root() / "store" / "embeddings.json");
    return *sharedStore_;
}

std::string Server::acknowledgedRootHash(const std::string& projectId) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    return p->state.tree.rootHash();
}

std::optional<std::vector<std::string>> Server::chunksFor(const std::string& projectId, const std::string& path) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    const auto it = p->state.chunks.find(path);
    if (it == p->state.chunks.end()) return std::nullopt;
    return it->second;
}

std::shared_ptr<tl::index::VectorIndex> Server::vectorIndex(const std::string& projectId) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    return p->index;
}

bool Server::hasSession(const std::string& projectId) {
    const auto p = project(projectId);
    std::scoped_lock lock(p->mutex);
    return p->session.has_value();
}
