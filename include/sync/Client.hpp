#pragma once

#include "sync/CycleReport.hpp"
#include "fs/Enumerator.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>

namespace tl::protocols { class Transport; }

namespace tl::sync {

struct ClientOptions {
    std::string projectId;
    std::string projectName;
    std::filesystem::path root;
    config::RetryConfig retry;
    uintmax_t pushBatchBytes = config::PUSH_BATCH_BYTES;

    // project_id / project_name default to the detected root path and its directory name
    static ClientOptions fromConfig(const config::Config& cfg);
};

/**
 * Client role of the sync protocol.
 *
 * runCycle() enumerates the project, probes the server and, on mismatch,
 * negotiates the change-set, pushes changed contents and removals, then
 * commits. Network calls are retried with bounded backoff. Nothing is
 * committed unless every step before commit completed.
 */
class Client {
public:
    Client(ClientOptions opts, std::shared_ptr<protocols::Transport> transport, fs::Enumerator enumerator);

    // interrupt, if given, is polled between steps, during retry sleeps and by the transport.
    CycleReport runCycle(const std::atomic<bool>* interrupt = nullptr);

    [[nodiscard]] const ClientOptions& options() const { return opts_; }

private:
    ClientOptions opts_;
    std::shared_ptr<protocols::Transport> transport_;
    fs::Enumerator enumerator_;
    bool registered_ = false;

    void runSteps(CycleReport& report, const std::atomic<bool>* interrupt);
};

}
