// Sync
#include "sync/Client.hpp"
#include "sync/Server.hpp"
#include "sync/StateStore.hpp"

// Protocols
#include "protocols/Dispatcher.hpp"
#include "protocols/HttpTransport.hpp"
#include "protocols/LoopbackTransport.hpp"
#include "protocols/ProtocolService.hpp"

// Indexing
#include "index/Pipeline.hpp"
#include "index/VectorIndex.hpp"
#include "embed/Provider.hpp"
#include "crypto/KeyRing.hpp"

// Watch
#include "watch/Manager.hpp"

// Misc
#include "config/ConfigRegistry.hpp"
#include "concurrency/ThreadPool.hpp"
#include "fs/IgnoreRules.hpp"
#include "log/Registry.hpp"
#include "runtime/paths.hpp"

// Libraries
#include <atomic>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <nlohmann/json.hpp>

using namespace tl;
using namespace tl::config;
using namespace tl::log;

namespace {
std::atomic<bool> shouldExit = false;
std::atomic<bool> reopenLogs = false;

void signalHandler(const int signum) {
    if (signum == SIGHUP) reopenLogs = true;
    else shouldExit = true;
}

struct Args {
    std::string mode;
    std::optional<std::filesystem::path> config;
    std::optional<std::filesystem::path> root;
    bool local = false;
};

void usage() {
    std::cerr << "usage: treeline <serve|sync|watch|projects|health> [--config PATH] [--root DIR] [--local]\n"
                 "  serve      run the sync server\n"
                 "  sync       run one sync cycle for the project and exit\n"
                 "  watch      keep the project in sync until interrupted\n"
                 "  projects   list projects known to the server\n"
                 "  health     query server health\n"
                 "  --local    sync against an in-process server sharing this machine's state dir\n";
}

std::optional<Args> parseArgs(const int argc, char** argv) {
    if (argc < 2) return std::nullopt;
    Args a{.mode = argv[1]};
    for (int i = 2; i < argc; ++i) {
        const std::string_view arg = argv[i];
        if (arg == "--local") a.local = true;
        else if (arg == "--config" && i + 1 < argc) a.config = argv[++i];
        else if (arg == "--root" && i + 1 < argc) a.root = argv[++i];
        else return std::nullopt;
    }
    return a;
}

std::shared_ptr<protocols::Dispatcher> makeServerStack(const Config& cfg) {
    const auto keys = std::make_shared<crypto::KeyRing>(cfg.keyFile(), crypto::util::parseCipher(cfg.crypto.cipher),
                                                        cfg.crypto.key_id);
    const auto pipeline = std::make_shared<index::Pipeline>(embed::makeProvider(cfg.embedding), keys,
                                                            index::Chunker(cfg.chunking.max_chars),
                                                            cfg.embedding.retry);
    const auto store = std::make_shared<sync::StateStore>(cfg.stateDir());
    const auto server = std::make_shared<sync::Server>(store, pipeline, index::makeVectorIndexFactory(cfg.vector_index));
    return std::make_shared<protocols::Dispatcher>(server);
}

std::shared_ptr<protocols::Transport> makeTransport(const Config& cfg, const bool local) {
    if (local) return std::make_shared<protocols::LoopbackTransport>(makeServerStack(cfg));
    return std::make_shared<protocols::HttpTransport>(cfg.client.server_url, cfg.client.timeout_seconds);
}

sync::ClientOptions clientOptions(Config cfg, const Args& args) {
    if (args.root) cfg.client.project_root = *args.root;
    return sync::ClientOptions::fromConfig(cfg);
}

void waitForExit() {
    while (!shouldExit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
        if (reopenLogs.exchange(false)) {
            Registry::reopenMainLog();
            Registry::reopenAuditLog();
        }
    }
}

int runServe(const Config& cfg) {
    protocols::ProtocolService service(cfg.server, makeServerStack(cfg));
    service.start();
    if (!service.waitUntilListening(std::chrono::seconds(10))) {
        Registry::treeline()->error("[-] Server did not start listening on {}:{}", cfg.server.host, cfg.server.port);
        service.stop();
        return EXIT_FAILURE;
    }

    Registry::treeline()->info("[✓] Treeline server listening on {}:{}", cfg.server.host, service.port());
    waitForExit();

    Registry::treeline()->info("[*] Shutting down Treeline server...");
    service.stop();
    return EXIT_SUCCESS;
}

int runSync(const Config& cfg, const Args& args) {
    const auto opts = clientOptions(cfg, args);
    const auto pool = std::make_shared<concurrency::ThreadPool>();
    sync::Client client(opts, makeTransport(cfg, args.local),
                        fs::Enumerator(fs::IgnoreRules::forProject(opts.root, cfg.ignore), pool));

    const auto report = client.runCycle(&shouldExit);
    std::cout << report.summary() << std::endl;
    for (const auto& r : report.rejected) std::cout << "  rejected " << r.path << ": " << r.reason << std::endl;
    for (const auto& w : report.warnings) std::cout << "  warning " << w.path << ": " << w.message << std::endl;

    pool->stop();
    if (report.ok()) return EXIT_SUCCESS;
    return report.status == sync::CycleStatus::Partial ? 3 : EXIT_FAILURE;
}

int runWatch(const Config& cfg, const Args& args) {
    const auto opts = clientOptions(cfg, args);
    const auto pool = std::make_shared<concurrency::ThreadPool>();
    const auto client = std::make_shared<sync::Client>(
        opts, makeTransport(cfg, args.local), fs::Enumerator(fs::IgnoreRules::forProject(opts.root, cfg.ignore), pool));

    watch::Manager manager;
    manager.start(watch::ProjectConfig::fromConfig(cfg, opts.projectId, opts.root),
                  [client](const std::atomic<bool>& interrupt) { return client->runCycle(&interrupt); });

    waitForExit();

    Registry::treeline()->info("[*] Stopping watchers...");
    manager.stopAll();
    pool->stop();
    return EXIT_SUCCESS;
}

int runQuery(const Config& cfg, const std::string_view op) {
    protocols::HttpTransport transport(cfg.client.server_url, cfg.client.timeout_seconds);
    std::cout << transport.call(op, nullptr).dump(2) << std::endl;
    return EXIT_SUCCESS;
}
}

int main(const int argc, char** argv) {
    const auto args = parseArgs(argc, argv);
    if (!args) {
        usage();
        return 2;
    }

    try {
        ConfigRegistry::init(args->config.value_or(paths::getConfigPath()));
        Registry::init();
        const auto& cfg = ConfigRegistry::get();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        std::signal(SIGHUP, signalHandler);

        if (args->mode == "serve") return runServe(cfg);
        if (args->mode == "sync") return runSync(cfg, *args);
        if (args->mode == "watch") return runWatch(cfg, *args);
        if (args->mode == "projects" || args->mode == "health") return runQuery(cfg, args->mode);

        usage();
        return 2;
    } catch (const std::exception& e) {
        if (Registry::isInitialized()) Registry::treeline()->error("[-] Treeline failed: {}", e.what());
        else std::cerr << "treeline: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
