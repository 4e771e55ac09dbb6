#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace tl::config {

constexpr static uintmax_t MAX_BODY_BYTES = 64 * 1024 * 1024; // 64MB
constexpr static uintmax_t PUSH_BATCH_BYTES = 4 * 1024 * 1024;  // 4MB

struct ServerConfig {
    std::string host = "127.0.0.1";
    uint16_t port = 33380;
    uintmax_t max_body_bytes = MAX_BODY_BYTES;
};

struct ClientConfig {
    std::string server_url = "http://127.0.0.1:33380";
    std::string project_id;     // empty => absolute project root
    std::string project_name;   // empty => root directory name
    std::filesystem::path project_root;     // empty => detected from the working directory
    unsigned int timeout_seconds = 10;
    uintmax_t push_batch_bytes = PUSH_BATCH_BYTES;
};

struct RetryConfig {
    unsigned int max_attempts = 4;
    unsigned int initial_delay_ms = 200;
    unsigned int max_delay_ms = 5000;
};

struct SyncConfig {
    unsigned int interval_seconds = 300;
    unsigned int debounce_ms = 500;
    unsigned int max_debounce_ms = 5000;
    bool use_inotify = true;
    RetryConfig retry;
};

struct IgnoreConfig {
    std::string file_name = ".treelineignore";
    std::vector<std::string> patterns = {"build/", "node_modules/", "__pycache__/", "*.o", "*.pyc"};
};

struct ChunkingConfig {
    unsigned int max_chars = 1500;
};

struct EmbeddingConfig {
    std::string provider = "hashing";   // hashing | http
    std::string endpoint = "http://127.0.0.1:8080/v1/embeddings";
    std::string model = "text-embedding-3-small";
    unsigned int dimensions = 256;
    unsigned int timeout_seconds = 30;
    std::string api_key_env = "TREELINE_EMBEDDING_API_KEY";
    RetryConfig retry;
};

struct VectorIndexConfig {
    std::string kind = "file";          // memory | file | http
    std::string endpoint = "http://127.0.0.1:33381";   // base URL of a store speaking upsertEmbedding
    unsigned int timeout_seconds = 10;
};

struct CryptoConfig {
    std::string cipher = "xchacha20poly1305";   // xchacha20poly1305 | aes256gcm
    std::filesystem::path key_file;             // empty => <state_dir>/keys/index.key
    std::string key_id;                         // empty => derived from key digest
};

struct StorageConfig {
    std::filesystem::path state_dir;            // empty => paths::getStatePath()
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum treeline = spdlog::level::info;   // startup/shutdown, cycle summaries
    spdlog::level::level_enum fs       = spdlog::level::warn;   // unreadable files, bad ignore rules
    spdlog::level::level_enum merkle   = spdlog::level::warn;   // snapshot verification failures
    spdlog::level::level_enum sync     = spdlog::level::info;   // per-cycle protocol steps
    spdlog::level::level_enum crypto   = spdlog::level::warn;   // key handling, cipher failures
    spdlog::level::level_enum embed    = spdlog::level::warn;   // provider errors and retries
    spdlog::level::level_enum index    = spdlog::level::warn;   // upsert/evict failures
    spdlog::level::level_enum watch    = spdlog::level::info;   // triggers and watcher lifecycle
    spdlog::level::level_enum http     = spdlog::level::warn;   // transport errors
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;              // empty => paths::getLogPath()
    LogLevelsConfig levels;
};

struct Config {
    ServerConfig server;
    ClientConfig client;
    SyncConfig sync;
    IgnoreConfig ignore;
    ChunkingConfig chunking;
    EmbeddingConfig embedding;
    VectorIndexConfig vector_index;
    CryptoConfig crypto;
    StorageConfig storage;
    LoggingConfig logging;

    [[nodiscard]] std::filesystem::path stateDir() const;
    [[nodiscard]] std::filesystem::path keyFile() const;
};

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const ServerConfig& c);
void to_json(nlohmann::json& j, const ClientConfig& c);
void to_json(nlohmann::json& j, const RetryConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const IgnoreConfig& c);
void to_json(nlohmann::json& j, const ChunkingConfig& c);
void to_json(nlohmann::json& j, const EmbeddingConfig& c);
void to_json(nlohmann::json& j, const VectorIndexConfig& c);
void to_json(nlohmann::json& j, const CryptoConfig& c);
void to_json(nlohmann::json& j, const StorageConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

} // namespace tl::config
