#include "sync/Client.hpp"
#include "merkle/Builder.hpp"
#include "merkle/Snapshot.hpp"
#include "fs/Project.hpp"
#include "protocols/Transport.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "util/retry.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <thread>

using namespace tl::sync;
using namespace tl::sync::model;
using nlohmann::json;

ClientOptions ClientOptions::fromConfig(const config::Config& cfg) {
    ClientOptions o;
    o.root = cfg.client.project_root.empty() ? fs::detectProjectRoot(std::filesystem::current_path())
                                             : std::filesystem::absolute(cfg.client.project_root).lexically_normal();
    o.projectId = cfg.client.project_id.empty() ? fs::defaultProjectId(o.root) : cfg.client.project_id;
    o.projectName = cfg.client.project_name.empty() ? o.root.filename().string() : cfg.client.project_name;
    o.retry = cfg.sync.retry;
    o.pushBatchBytes = cfg.client.push_batch_bytes;
    return o;
}

// Whether path is a reject or lies under a rejected directory. "." stands for the whole project.
static bool coveredByReject(const std::vector<tl::fs::model::Reject>& rejects, const std::string& path) {
    return std::ranges::any_of(rejects, [&](const tl::fs::model::Reject& r) {
        return r.path == "." || r.path == path || path.starts_with(r.path + '/');
    });
}

Client::Client(ClientOptions opts, std::shared_ptr<protocols::Transport> transport, fs::Enumerator enumerator)
    : opts_(std::move(opts)), transport_(std::move(transport)), enumerator_(std::move(enumerator)) {
    if (!transport_) throw std::invalid_argument("Client requires a transport");
    if (opts_.projectId.empty()) opts_.projectId = fs::defaultProjectId(opts_.root);
}

CycleReport Client::runCycle(const std::atomic<bool>* interrupt) {
    CycleReport report;
    report.projectId = opts_.projectId;
    transport_->setInterruptFlag(interrupt);

    try {
        runSteps(report, interrupt);
    } catch (const CancelledError& e) {
        report.status = CycleStatus::Cancelled;
        report.error = e.what();
        report.errorKind = e.kind();
    } catch (const TransientNetworkError& e) {
        report.status = CycleStatus::Degraded;
        report.error = e.what();
        report.errorKind = e.kind();
    } catch (const Error& e) {
        report.status = CycleStatus::Failed;
        report.error = e.what();
        report.errorKind = e.kind();
    } catch (const std::exception& e) {
        report.status = CycleStatus::Failed;
        report.error = e.what();
        report.errorKind = "Error";
    }

    transport_->setInterruptFlag(nullptr);

    const auto& log = log::Registry::sync();
    if (report.ok()) log->info("[Client] {}", report.summary());
    else if (report.status == CycleStatus::Partial || report.status == CycleStatus::Cancelled) log->warn("[Client] {}", report.summary());
    else log->error("[Client] {}", report.summary());

    return report;
}

void Client::runSteps(CycleReport& report, const std::atomic<bool>* interrupt) {
    const auto checkInterrupt = [interrupt](const std::string_view step) {
        if (interrupt && interrupt->load()) throw CancelledError("Stopped before " + std::string(step));
    };

    const util::SleepFn sleep = [interrupt, &report](const std::chrono::milliseconds d) {
        ++report.retries;
        const auto deadline = std::chrono::steady_clock::now() + d;
        while (std::chrono::steady_clock::now() < deadline) {
            if (interrupt && interrupt->load()) return false;
            std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(
                std::chrono::milliseconds(25), deadline - std::chrono::steady_clock::now()));
        }
        return true;
    };

    const auto call = [&](const std::string_view op, const json& body) {
        return util::withRetry<TransientNetworkError>(
            opts_.retry,
            [&] { return transport_->call(op, body); },
            sleep,
            [op] { throw CancelledError("Stopped while retrying " + std::string(op)); },
            log::Registry::sync(),
            op);
    };

    checkInterrupt("enumeration");
    auto built = merkle::Builder::build(opts_.root, enumerator_);
    const auto& tree = built.tree;
    report.rootHash = tree.rootHash();

    for (const auto& r : built.rejects) {
        report.rejected.push_back({r.path, "Unreadable"});
        report.pendingRetry.push_back(r.path);
        report.warnings.push_back({r.path, "EnumerationError", r.reason});
    }

    const auto registerProject = [&] {
        checkInterrupt("register");
        call("register", {{"projectId", opts_.projectId}, {"name", opts_.projectName}});
        registered_ = true;
    };

    if (!registered_) registerProject();

    checkInterrupt("probe");
    if (call("probe", {{"projectId", opts_.projectId}, {"rootHash", tree.rootHash()}}).value("upToDate", false)) {
        report.acknowledgedRootHash = tree.rootHash();
        report.status = report.rejected.empty() ? CycleStatus::UpToDate : CycleStatus::Partial;
        return;
    }

    checkInterrupt("negotiate");
    const json negotiateBody{{"projectId", opts_.projectId}, {"treeSnapshot", merkle::serialize(tree)}};
    json negotiated;
    try {
        negotiated = call("negotiate", negotiateBody);
    } catch (const ProtocolError& e) {
        if (!std::string_view(e.what()).ends_with(" is not registered")) throw;
        log::Registry::sync()->warn("[Client] Server no longer knows {}, registering again", opts_.projectId);
        registered_ = false;
        registerProject();
        checkInterrupt("negotiate");
        negotiated = call("negotiate", negotiateBody);
    }
    report.changeSet = negotiated.at("changedPaths").get<merkle::ChangeSet>();
    const auto& changes = report.changeSet;

    std::vector<std::string> toSend;
    toSend.insert(toSend.end(), changes.added.begin(), changes.added.end());
    toSend.insert(toSend.end(), changes.modified.begin(), changes.modified.end());
    std::ranges::sort(toSend);

    std::vector<PushItem> batch;
    uintmax_t batchBytes = 0;
    const auto flush = [&] {
        if (batch.empty()) return;
        checkInterrupt("pushChanges");
        const auto res = call("pushChanges", {{"projectId", opts_.projectId}, {"items", batch}}).get<PushResult>();
        report.accepted.insert(report.accepted.end(), res.accepted.begin(), res.accepted.end());
        report.warnings.insert(report.warnings.end(), res.warnings.begin(), res.warnings.end());
        batch.clear();
        batchBytes = 0;
    };

    for (const auto& path : toSend) {
        const auto leaf = tree.leafHash(path);
        if (!leaf) throw ProtocolError("Server asked for " + path + ", which is not in the local snapshot");

        std::string content;
        try {
            content = util::readFileToString(opts_.root / path);
        } catch (const std::runtime_error& e) {
            log::Registry::sync()->warn("[Client] {} became unreadable: {}", path, e.what());
            continue;   // reported NotTransmitted at commit
        }

        if (crypto::hash::blake2b(content) != *leaf)
            log::Registry::sync()->debug("[Client] {} changed since enumeration; server will reject it", path);

        batchBytes += content.size();
        batch.push_back({path, std::move(content), *leaf});
        if (batchBytes >= opts_.pushBatchBytes) flush();
    }
    flush();

    // a file that could not be read is not gone; its removal waits for a readable enumeration
    std::vector<std::string> removed;
    for (const auto& path : changes.removed) {
        if (!coveredByReject(built.rejects, path)) removed.push_back(path);
        else log::Registry::sync()->debug("[Client] Withholding removal of unreadable {}", path);
    }

    if (!removed.empty()) {
        checkInterrupt("pushRemovals");
        if (!call("pushRemovals", {{"projectId", opts_.projectId}, {"paths", removed}}).value("ack", false))
            log::Registry::sync()->warn("[Client] Server did not acknowledge every removal for {}", opts_.projectId);
    }

    checkInterrupt("commit");
    const auto committed = call("commit", {{"projectId", opts_.projectId}, {"rootHash", tree.rootHash()}}).get<CommitResult>();
    report.acknowledgedRootHash = committed.acknowledgedRootHash;

    std::erase_if(report.accepted, [&](const std::string& p) {
        return std::ranges::any_of(committed.rejected, [&](const Rejection& r) { return r.path == p; });
    });
    for (const auto& r : committed.rejected) {
        report.rejected.push_back(r);
        report.pendingRetry.push_back(r.path);
    }
    for (const auto& p : committed.pendingRemovals)
        if (std::ranges::find(report.pendingRetry, p) == report.pendingRetry.end()) report.pendingRetry.push_back(p);

    report.status = report.rejected.empty() && report.pendingRetry.empty() ? CycleStatus::Synced : CycleStatus::Partial;
}
