#include <gtest/gtest.h>
#include "sync/Client.hpp"
#include "sync/Server.hpp"
#include "sync/StateStore.hpp"
#include "protocols/Dispatcher.hpp"
#include "protocols/LoopbackTransport.hpp"
#include "index/Pipeline.hpp"
#include "index/VectorIndex.hpp"
#include "index/MemoryVectorIndex.hpp"
#include "index/Chunker.hpp"
#include "merkle/Builder.hpp"
#include "merkle/Snapshot.hpp"
#include "crypto/KeyRing.hpp"
#include "crypto/util/hash.hpp"
#include "util/errors.hpp"
#include "util/files.hpp"
#include "TestProject.hpp"
#include "TestProviders.hpp"

#include <algorithm>
#include <fstream>
#include <functional>
#include <set>
#include <nlohmann/json.hpp>

using namespace tl::sync;
using namespace tl::sync::model;
using tl::crypto::hash::blake2b;
using nlohmann::json;

namespace {

const tl::config::RetryConfig FAST_RETRY{.max_attempts = 3, .initial_delay_ms = 1, .max_delay_ms = 2};

// Forwards to another transport, failing or raising a flag on chosen ops.
class ScriptedTransport final : public tl::protocols::Transport {
public:
    explicit ScriptedTransport(std::shared_ptr<Transport> inner) : inner_(std::move(inner)) {}

    json call(const std::string_view op, const json& body) override {
        calls.emplace_back(op);
        if (op == failOp && failures != 0) {
            if (failures > 0) --failures;
            throw tl::TransientNetworkError("injected failure on " + std::string(op));
        }
        auto out = inner_->call(op, body);
        if (flag && op == raiseAfter) flag->store(true);
        if (op == loseResponseOf && responsesToLose > 0) {
            --responsesToLose;
            throw tl::TransientNetworkError("response to " + std::string(op) + " lost");
        }
        return out;
    }

    std::string failOp;
    int failures = -1;      // negative => every call
    std::string loseResponseOf;     // the server handles the call, the caller sees a network failure
    int responsesToLose = 0;
    std::string raiseAfter;
    std::atomic<bool>* flag = nullptr;
    std::vector<std::string> calls;

private:
    std::shared_ptr<Transport> inner_;
};

// Resolves its target on every call, so a test can replace the server under a running client.
class IndirectTransport final : public tl::protocols::Transport {
public:
    explicit IndirectTransport(std::function<std::shared_ptr<Transport>()> target) : target_(std::move(target)) {}

    json call(const std::string_view op, const json& body) override { return target_()->call(op, body); }

private:
    std::function<std::shared_ptr<Transport>()> target_;
};

// Declines to store chosen chunk hashes, like a remote store answering {"stored": false}.
class RefusingIndex final : public tl::index::MemoryVectorIndex {
public:
    bool upsert(const tl::index::model::EmbeddingRecord& record) override {
        if (refused.contains(record.chunkHash)) return false;
        return MemoryVectorIndex::upsert(record);
    }

    std::set<std::string> refused;
};

// Fails the way a cipher failure surfaces from the pipeline.
class SealFailureProvider final : public tl::embed::Provider {
public:
    std::vector<float> embed(const std::string&) override { throw tl::EncryptionError("sealing key unavailable"); }
    [[nodiscard]] std::string_view name() const override { return "seal-failure"; }
    [[nodiscard]] unsigned int dimensions() const override { return 32; }
};

}

class SyncCycleTest : public TempProjectTest {
protected:
    static constexpr auto PROJECT_ID = "proj";

    fs::path project, state;
    std::shared_ptr<tl::crypto::KeyRing> keys;
    std::shared_ptr<FlakyProvider> provider;
    std::shared_ptr<Server> server;
    std::shared_ptr<tl::protocols::Dispatcher> dispatcher;

    void SetUp() override {
        TempProjectTest::SetUp();
        project = root / "project";
        state = root / "state";
        fs::create_directories(project);
        keys = std::make_shared<tl::crypto::KeyRing>(tl::crypto::KeyRing::generateKey(),
                                                     tl::crypto::util::Cipher::XChaCha20Poly1305);
        provider = std::make_shared<FlakyProvider>(0, "POISON");
        startServer();
    }

    void startServer(tl::index::VectorIndexFactory indexFactory = nullptr,
                     std::shared_ptr<tl::embed::Provider> embedder = nullptr) {
        if (!embedder) embedder = provider;
        const auto pipeline = std::make_shared<tl::index::Pipeline>(embedder, keys, tl::index::Chunker(64), FAST_RETRY, noSleep);
        if (!indexFactory) {
            tl::config::VectorIndexConfig vc;
            vc.kind = "file";
            indexFactory = tl::index::makeVectorIndexFactory(vc);
        }
        server = std::make_shared<Server>(std::make_shared<StateStore>(state), pipeline, std::move(indexFactory));
        dispatcher = std::make_shared<tl::protocols::Dispatcher>(server);
    }

    [[nodiscard]] std::shared_ptr<tl::protocols::Transport> loopback() const {
        return std::make_shared<tl::protocols::LoopbackTransport>(dispatcher);
    }

    [[nodiscard]] Client client(std::shared_ptr<tl::protocols::Transport> transport = nullptr,
                                tl::fs::Enumerator::HashFn hash = nullptr) const {
        ClientOptions opts{.projectId = PROJECT_ID, .projectName = "Project", .root = project, .retry = FAST_RETRY};
        return {opts, transport ? std::move(transport) : loopback(),
                tl::fs::Enumerator(tl::fs::IgnoreRules{}, nullptr, std::move(hash))};
    }

    void put(const std::string& rel, const std::string& content) const { writeFile("project/" + rel, content); }
    void drop(const std::string& rel) const { removeFile("project/" + rel); }

    [[nodiscard]] tl::merkle::Tree localTree() const {
        return tl::merkle::Builder::build(project, tl::fs::Enumerator(tl::fs::IgnoreRules{})).tree;
    }

    [[nodiscard]] std::string ackRoot() const { return server->acknowledgedRootHash(PROJECT_ID); }
};

TEST_F(SyncCycleTest, FirstSyncAddsEverythingThenIdempotent) {
    put("d/a.txt", "hello");
    put("d/b.txt", "world");
    auto c = client();

    const auto first = c.runCycle();
    EXPECT_EQ(first.status, CycleStatus::Synced) << first.summary();
    EXPECT_EQ(first.changeSet.added, (std::set<std::string>{"d/a.txt", "d/b.txt"}));
    EXPECT_TRUE(first.changeSet.modified.empty());
    EXPECT_TRUE(first.changeSet.removed.empty());
    EXPECT_EQ(first.acknowledgedRootHash, first.rootHash);
    EXPECT_EQ(ackRoot(), first.rootHash);
    EXPECT_TRUE(first.ok());

    const auto second = c.runCycle();
    EXPECT_EQ(second.status, CycleStatus::UpToDate);
    EXPECT_TRUE(second.changeSet.empty());
    EXPECT_EQ(ackRoot(), first.rootHash);
    EXPECT_FALSE(server->hasSession(PROJECT_ID));
}

TEST_F(SyncCycleTest, EditReportsOnlyTheModifiedFile) {
    put("d/a.txt", "hello");
    put("d/b.txt", "world");
    auto c = client();
    const auto a = c.runCycle();
    const auto aLeaf = localTree().leafHash("d/a.txt");

    put("d/b.txt", "world!");
    const auto b = c.runCycle();
    EXPECT_EQ(b.status, CycleStatus::Synced) << b.summary();
    EXPECT_EQ(b.changeSet.modified, (std::set<std::string>{"d/b.txt"}));
    EXPECT_TRUE(b.changeSet.added.empty());
    EXPECT_EQ(localTree().leafHash("d/a.txt"), aLeaf);
    EXPECT_NE(b.rootHash, a.rootHash);
    EXPECT_EQ(ackRoot(), b.rootHash);
}

TEST_F(SyncCycleTest, DeleteEvictsEmbeddings) {
    put("d/a.txt", "hello");
    put("d/b.txt", "world");
    auto c = client();
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);

    const auto aChunks = server->chunksFor(PROJECT_ID, "d/a.txt");
    ASSERT_TRUE(aChunks.has_value());
    ASSERT_FALSE(aChunks->empty());
    const auto index = server->vectorIndex(PROJECT_ID);
    for (const auto& h : *aChunks) EXPECT_TRUE(index->contains(h));

    drop("d/a.txt");
    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Synced) << r.summary();
    EXPECT_EQ(r.changeSet.removed, (std::set<std::string>{"d/a.txt"}));
    EXPECT_FALSE(server->chunksFor(PROJECT_ID, "d/a.txt").has_value());
    for (const auto& h : *aChunks) EXPECT_FALSE(index->contains(h));
    EXPECT_TRUE(server->chunksFor(PROJECT_ID, "d/b.txt").has_value());
}

TEST_F(SyncCycleTest, SharedChunkSurvivesWhileStillReferenced) {
    put("one.txt", "shared body\n");
    put("two.txt", "shared body\n");
    auto c = client();
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);

    const auto hashes = *server->chunksFor(PROJECT_ID, "one.txt");
    EXPECT_EQ(hashes, *server->chunksFor(PROJECT_ID, "two.txt"));

    drop("one.txt");
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);
    for (const auto& h : hashes) EXPECT_TRUE(server->vectorIndex(PROJECT_ID)->contains(h));
}

TEST_F(SyncCycleTest, CorruptedContentRejectedOthersAccepted) {
    put("d/a.txt", "hello");
    put("d/b.txt", "world");
    server->registerProject(PROJECT_ID, "Project");

    const auto tree = localTree();
    const auto changes = server->negotiate(PROJECT_ID, tree);
    ASSERT_EQ(changes.added.size(), 2u);

    const auto result = server->pushChanges(PROJECT_ID, {
        {"d/a.txt", "hello", *tree.leafHash("d/a.txt")},
        {"d/b.txt", "w0rld", *tree.leafHash("d/b.txt")},
    });
    EXPECT_EQ(result.accepted, (std::vector<std::string>{"d/a.txt"}));
    ASSERT_EQ(result.rejected.size(), 1u);
    EXPECT_EQ(result.rejected[0], (Rejection{"d/b.txt", "HashMismatch"}));

    const auto committed = server->commit(PROJECT_ID, tree.rootHash());
    EXPECT_TRUE(committed.committed);
    EXPECT_FALSE(committed.upToDate);
    EXPECT_NE(committed.acknowledgedRootHash, tree.rootHash());

    // the rejected path is offered again by the next cycle
    auto c = client();
    const auto next = c.runCycle();
    EXPECT_EQ(next.status, CycleStatus::Synced) << next.summary();
    EXPECT_EQ(next.changeSet.added, (std::set<std::string>{"d/b.txt"}));
    EXPECT_EQ(ackRoot(), tree.rootHash());
}

TEST_F(SyncCycleTest, UntransmittedPathsAreRejectedAtCommit) {
    put("x.txt", "x");
    put("y.txt", "y");
    server->registerProject(PROJECT_ID, "");
    const auto tree = localTree();
    (void)server->negotiate(PROJECT_ID, tree);
    (void)server->pushChanges(PROJECT_ID, {{"x.txt", "x", blake2b(std::string_view("x"))}});

    const auto committed = server->commit(PROJECT_ID, tree.rootHash());
    ASSERT_EQ(committed.rejected.size(), 1u);
    EXPECT_EQ(committed.rejected[0], (Rejection{"y.txt", "NotTransmitted"}));
    EXPECT_EQ(committed.acknowledgedRootHash,
              tl::merkle::Builder::fromLeaves({{"x.txt", blake2b(std::string_view("x"))}}).rootHash());
}

TEST_F(SyncCycleTest, PathOutsideChangeSetRejected) {
    put("x.txt", "x");
    server->registerProject(PROJECT_ID, "");
    (void)server->negotiate(PROJECT_ID, localTree());
    const auto r = server->pushChanges(PROJECT_ID, {{"sneaky.txt", "s", blake2b(std::string_view("s"))}});
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0].reason, "NotInChangeSet");
}

TEST_F(SyncCycleTest, UnackedRemovalStaysPending) {
    put("gone.txt", "g");
    put("keep.txt", "k");
    auto c = client();
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();

    drop("gone.txt");
    const auto tree = localTree();
    const auto changes = server->negotiate(PROJECT_ID, tree);
    ASSERT_EQ(changes.removed, (std::set<std::string>{"gone.txt"}));

    const auto committed = server->commit(PROJECT_ID, tree.rootHash());
    EXPECT_EQ(committed.pendingRemovals, (std::vector<std::string>{"gone.txt"}));
    EXPECT_EQ(committed.acknowledgedRootHash, before);

    const auto next = c.runCycle();
    EXPECT_EQ(next.changeSet.removed, (std::set<std::string>{"gone.txt"}));
    EXPECT_EQ(next.status, CycleStatus::Synced);
}

TEST_F(SyncCycleTest, ProviderFailureRejectsOnlyThatFile) {
    put("good.txt", "fine content\n");
    put("bad.txt", "POISON pill\n");
    auto c = client();

    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Partial) << r.summary();
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.accepted, (std::vector<std::string>{"good.txt"}));
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0], (Rejection{"bad.txt", "EmbeddingProviderError"}));
    EXPECT_EQ(r.pendingRetry, (std::vector<std::string>{"bad.txt"}));
    EXPECT_TRUE(server->chunksFor(PROJECT_ID, "good.txt").has_value());
    EXPECT_FALSE(server->chunksFor(PROJECT_ID, "bad.txt").has_value());

    put("bad.txt", "cured\n");
    const auto again = c.runCycle();
    EXPECT_EQ(again.status, CycleStatus::Synced) << again.summary();
    EXPECT_EQ(again.changeSet.added, (std::set<std::string>{"bad.txt"}));
}

TEST_F(SyncCycleTest, ExhaustedRetriesDegradeWithoutCommitting) {
    put("a.txt", "a");
    auto c = client();
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();

    put("a.txt", "a2");
    const auto flaky = std::make_shared<ScriptedTransport>(loopback());
    flaky->failOp = "commit";
    auto c2 = client(flaky);

    const auto r = c2.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Degraded) << r.summary();
    EXPECT_EQ(r.errorKind, "TransientNetworkError");
    EXPECT_EQ(std::ranges::count(flaky->calls, "commit"), static_cast<long>(FAST_RETRY.max_attempts));
    EXPECT_EQ(r.retries, FAST_RETRY.max_attempts - 1);
    EXPECT_EQ(ackRoot(), before);
}

TEST_F(SyncCycleTest, TransientFailureRecoveredByRetry) {
    put("a.txt", "a");
    const auto flaky = std::make_shared<ScriptedTransport>(loopback());
    flaky->failOp = "negotiate";
    flaky->failures = 1;
    auto c = client(flaky);

    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Synced) << r.summary();
    EXPECT_EQ(r.retries, 1u);
    EXPECT_EQ(ackRoot(), r.rootHash);
}

TEST_F(SyncCycleTest, InterruptedCycleLeavesServerUntouched) {
    put("a.txt", "a");
    auto c = client();
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();

    put("b.txt", "b");
    std::atomic<bool> stop{false};
    const auto scripted = std::make_shared<ScriptedTransport>(loopback());
    scripted->raiseAfter = "pushChanges";
    scripted->flag = &stop;
    auto c2 = client(scripted);

    const auto r = c2.runCycle(&stop);
    EXPECT_EQ(r.status, CycleStatus::Cancelled) << r.summary();
    EXPECT_EQ(std::ranges::count(scripted->calls, "commit"), 0);
    EXPECT_EQ(ackRoot(), before);
    EXPECT_FALSE(server->chunksFor(PROJECT_ID, "b.txt").has_value());
}

TEST_F(SyncCycleTest, StateSurvivesServerRestart) {
    put("d/a.txt", "hello");
    put("d/b.txt", "world");
    ASSERT_EQ(client().runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();
    const auto chunks = *server->chunksFor(PROJECT_ID, "d/a.txt");

    startServer();
    EXPECT_EQ(ackRoot(), before);
    EXPECT_TRUE(server->vectorIndex(PROJECT_ID)->contains(chunks.front()));

    const auto r = client().runCycle();
    EXPECT_EQ(r.status, CycleStatus::UpToDate) << r.summary();

    const auto projects = server->listProjects();
    ASSERT_EQ(projects.size(), 1u);
    EXPECT_EQ(projects[0].projectId, PROJECT_ID);
    EXPECT_EQ(projects[0].name, "Project");
    EXPECT_EQ(projects[0].fileCount, 2u);
}

TEST_F(SyncCycleTest, CorruptPersistedSnapshotRefused) {
    put("a.txt", "a");
    ASSERT_EQ(client().runCycle().status, CycleStatus::Synced);

    const auto file = StateStore(state).projectDir(PROJECT_ID) / "snapshot.json";
    auto j = json::parse(tl::util::readFileToString(file));
    j["tree"]["root"]["children"][0]["hash"] = blake2b(std::string_view("tampered"));
    {
        std::ofstream out(file, std::ios::trunc);
        out << j.dump();
    }

    startServer();
    EXPECT_THROW((void)server->acknowledgedRootHash(PROJECT_ID), tl::SnapshotError);
}

TEST_F(SyncCycleTest, EmptyProjectSyncs) {
    auto c = client();
    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::UpToDate) << r.summary();
    EXPECT_EQ(r.rootHash, tl::merkle::Tree::emptyHash());
}

TEST_F(SyncCycleTest, IndexRefusalRejectsFileAndKeepsItOutOfSnapshot) {
    put("good.txt", "fine content\n");
    put("refused.txt", "stored nowhere\n");
    const auto refusedHash = tl::index::Chunker(64).split("refused.txt", "stored nowhere\n").chunks.at(0).contentHash;

    const auto index = std::make_shared<RefusingIndex>();
    index->refused.insert(refusedHash);
    startServer([index](const fs::path&) { return index; });

    auto c = client();
    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Partial) << r.summary();
    EXPECT_EQ(r.accepted, (std::vector<std::string>{"good.txt"}));
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0], (Rejection{"refused.txt", "IndexRejected"}));
    EXPECT_EQ(r.pendingRetry, (std::vector<std::string>{"refused.txt"}));

    EXPECT_FALSE(server->chunksFor(PROJECT_ID, "refused.txt").has_value());
    EXPECT_FALSE(index->contains(refusedHash));
    for (const auto& h : *server->chunksFor(PROJECT_ID, "good.txt")) EXPECT_TRUE(index->contains(h));
    EXPECT_EQ(ackRoot(), tl::merkle::Builder::fromLeaves({{"good.txt", *localTree().leafHash("good.txt")}}).rootHash());

    index->refused.clear();
    const auto again = c.runCycle();
    EXPECT_EQ(again.status, CycleStatus::Synced) << again.summary();
    EXPECT_EQ(again.changeSet.added, (std::set<std::string>{"refused.txt"}));
    EXPECT_TRUE(index->contains(refusedHash));
}

TEST_F(SyncCycleTest, IndexRefusalOfEditKeepsPreviousVersion) {
    const auto index = std::make_shared<RefusingIndex>();
    startServer([index](const fs::path&) { return index; });

    put("a.txt", "first version\n");
    put("b.txt", "untouched\n");
    auto c = client();
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();
    const auto oldChunks = *server->chunksFor(PROJECT_ID, "a.txt");

    put("a.txt", "second version\n");
    index->refused.insert(tl::index::Chunker(64).split("a.txt", "second version\n").chunks.at(0).contentHash);
    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Partial) << r.summary();
    EXPECT_EQ(ackRoot(), before);
    EXPECT_EQ(*server->chunksFor(PROJECT_ID, "a.txt"), oldChunks);
    for (const auto& h : oldChunks) EXPECT_TRUE(index->contains(h));
    EXPECT_EQ(index->size(), 2u);
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0], (Rejection{"a.txt", "IndexRejected"}));
}

TEST_F(SyncCycleTest, UnreadableFileIsNotTreatedAsDeleted) {
    put("a.txt", "a");
    put("flaky.txt", "sometimes readable");
    std::atomic<bool> unreadable{false};
    const auto hash = [&unreadable](const fs::path& p) {
        if (unreadable.load() && p.filename() == "flaky.txt") throw std::runtime_error("Permission denied");
        return blake2b(p);
    };

    const auto scripted = std::make_shared<ScriptedTransport>(loopback());
    auto c = client(scripted, hash);
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();
    const auto flakyChunks = *server->chunksFor(PROJECT_ID, "flaky.txt");

    unreadable = true;
    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Partial) << r.summary();
    EXPECT_EQ(r.changeSet.removed, (std::set<std::string>{"flaky.txt"}));
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0], (Rejection{"flaky.txt", "Unreadable"}));
    EXPECT_EQ(r.pendingRetry, (std::vector<std::string>{"flaky.txt"}));
    EXPECT_EQ(std::ranges::count(scripted->calls, "pushRemovals"), 0);

    EXPECT_EQ(ackRoot(), before);
    EXPECT_EQ(*server->chunksFor(PROJECT_ID, "flaky.txt"), flakyChunks);
    for (const auto& h : flakyChunks) EXPECT_TRUE(server->vectorIndex(PROJECT_ID)->contains(h));

    unreadable = false;
    EXPECT_EQ(c.runCycle().status, CycleStatus::UpToDate);
}

TEST_F(SyncCycleTest, EncryptionFailureAbortsCycleWithoutCommitting) {
    put("a.txt", "a");
    ASSERT_EQ(client().runCycle().status, CycleStatus::Synced);
    const auto before = ackRoot();
    const auto recordsBefore = server->vectorIndex(PROJECT_ID)->size();

    startServer(nullptr, std::make_shared<SealFailureProvider>());
    put("b.txt", "b");
    const auto scripted = std::make_shared<ScriptedTransport>(loopback());
    const auto r = client(scripted).runCycle();

    EXPECT_EQ(r.status, CycleStatus::Failed) << r.summary();
    EXPECT_EQ(r.errorKind, "EncryptionError");
    EXPECT_EQ(r.retries, 0u);
    EXPECT_EQ(std::ranges::count(scripted->calls, "pushChanges"), 1);
    EXPECT_EQ(std::ranges::count(scripted->calls, "commit"), 0);
    EXPECT_FALSE(server->hasSession(PROJECT_ID));
    EXPECT_EQ(ackRoot(), before);
    EXPECT_FALSE(server->chunksFor(PROJECT_ID, "b.txt").has_value());
    EXPECT_EQ(server->vectorIndex(PROJECT_ID)->size(), recordsBefore);

    // the same failure as seen on the wire
    const auto tree = localTree();
    (void)server->negotiate(PROJECT_ID, tree);
    const auto res = dispatcher->handle("pushChanges", {
        {"projectId", PROJECT_ID},
        {"items", std::vector<PushItem>{{"b.txt", "b", *tree.leafHash("b.txt")}}},
    });
    EXPECT_EQ(res.status, 500u);
    EXPECT_EQ(res.body.at("kind"), "EncryptionError");
    EXPECT_FALSE(server->hasSession(PROJECT_ID));
}

TEST_F(SyncCycleTest, LostCommitResponseIsAnsweredFromLastCommit) {
    put("good.txt", "fine content\n");
    put("bad.txt", "POISON pill\n");
    const auto scripted = std::make_shared<ScriptedTransport>(loopback());
    scripted->loseResponseOf = "commit";
    scripted->responsesToLose = 1;
    auto c = client(scripted);

    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Partial) << r.summary();
    EXPECT_EQ(std::ranges::count(scripted->calls, "commit"), 2);
    EXPECT_EQ(r.retries, 1u);
    ASSERT_EQ(r.rejected.size(), 1u);
    EXPECT_EQ(r.rejected[0], (Rejection{"bad.txt", "EmbeddingProviderError"}));
    EXPECT_EQ(r.accepted, (std::vector<std::string>{"good.txt"}));
    EXPECT_EQ(r.acknowledgedRootHash, ackRoot());

    // only the root just committed is answered without a session
    EXPECT_THROW((void)server->commit(PROJECT_ID, blake2b(std::string_view("other"))), tl::ProtocolError);
}

TEST_F(SyncCycleTest, ClientRegistersAgainAfterServerStateLoss) {
    put("a.txt", "a");
    const auto scripted = std::make_shared<ScriptedTransport>(
        std::make_shared<IndirectTransport>([this] { return loopback(); }));
    auto c = client(scripted);
    ASSERT_EQ(c.runCycle().status, CycleStatus::Synced);

    fs::remove_all(state);
    startServer();
    put("b.txt", "b");

    const auto r = c.runCycle();
    EXPECT_EQ(r.status, CycleStatus::Synced) << r.summary();
    EXPECT_EQ(r.changeSet.added, (std::set<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(std::ranges::count(scripted->calls, "register"), 2);
    EXPECT_EQ(ackRoot(), r.rootHash);

    const auto projects = server->listProjects();
    ASSERT_EQ(projects.size(), 1u);
    EXPECT_EQ(projects[0].name, "Project");
}

TEST_F(SyncCycleTest, DispatcherMapsErrorsToStatus) {
    EXPECT_EQ(dispatcher->handle("nope", json::object()).status, 404u);

    const auto unregistered = dispatcher->handle("negotiate", {{"projectId", "ghost"}, {"treeSnapshot", tl::merkle::serialize(tl::merkle::Tree{})}});
    EXPECT_EQ(unregistered.status, 400u);
    EXPECT_EQ(unregistered.body.at("kind"), "ProtocolError");

    EXPECT_EQ(dispatcher->handle("probe", {{"rootHash", "x"}}).status, 400u);
    EXPECT_EQ(dispatcher->handle("commit", {{"projectId", PROJECT_ID}, {"rootHash", "x"}}).status, 400u);

    const auto health = dispatcher->handle("health", nullptr);
    EXPECT_EQ(health.status, 200u);
    EXPECT_EQ(health.body.at("status"), "ok");
}

TEST_F(SyncCycleTest, LoopbackRethrowsTypedErrors) {
    const auto t = loopback();
    EXPECT_THROW((void)t->call("commit", {{"projectId", PROJECT_ID}, {"rootHash", "x"}}), tl::ProtocolError);
    EXPECT_THROW((void)t->call("negotiate", {{"projectId", PROJECT_ID}, {"treeSnapshot", {{"root", 1}}}}), tl::SnapshotError);
}
