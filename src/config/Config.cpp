#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "runtime/paths.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace tl::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["server"]) YAML::convert<ServerConfig>::decode(node, cfg.server);
    if (auto node = root["client"]) YAML::convert<ClientConfig>::decode(node, cfg.client);
    if (auto node = root["sync"]) YAML::convert<SyncConfig>::decode(node, cfg.sync);
    if (auto node = root["ignore"]) YAML::convert<IgnoreConfig>::decode(node, cfg.ignore);
    if (auto node = root["chunking"]) YAML::convert<ChunkingConfig>::decode(node, cfg.chunking);
    if (auto node = root["embedding"]) YAML::convert<EmbeddingConfig>::decode(node, cfg.embedding);
    if (auto node = root["vector_index"]) YAML::convert<VectorIndexConfig>::decode(node, cfg.vector_index);
    if (auto node = root["crypto"]) YAML::convert<CryptoConfig>::decode(node, cfg.crypto);
    if (auto node = root["storage"]) YAML::convert<StorageConfig>::decode(node, cfg.storage);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

std::filesystem::path Config::stateDir() const {
    return storage.state_dir.empty() ? paths::getStatePath() : storage.state_dir;
}

std::filesystem::path Config::keyFile() const {
    return crypto.key_file.empty() ? stateDir() / "keys" / "index.key" : crypto.key_file;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"server", c.server},
        {"client", c.client},
        {"sync", c.sync},
        {"ignore", c.ignore},
        {"chunking", c.chunking},
        {"embedding", c.embedding},
        {"vector_index", c.vector_index},
        {"crypto", c.crypto},
        {"storage", c.storage},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {
        {"host", c.host},
        {"port", c.port},
        {"max_body_bytes", c.max_body_bytes}
    };
}

void to_json(nlohmann::json& j, const ClientConfig& c) {
    j = {
        {"server_url", c.server_url},
        {"project_id", c.project_id},
        {"project_name", c.project_name},
        {"project_root", c.project_root.string()},
        {"timeout_seconds", c.timeout_seconds},
        {"push_batch_bytes", c.push_batch_bytes}
    };
}

void to_json(nlohmann::json& j, const RetryConfig& c) {
    j = {
        {"max_attempts", c.max_attempts},
        {"initial_delay_ms", c.initial_delay_ms},
        {"max_delay_ms", c.max_delay_ms}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"interval_seconds", c.interval_seconds},
        {"debounce_ms", c.debounce_ms},
        {"max_debounce_ms", c.max_debounce_ms},
        {"use_inotify", c.use_inotify},
        {"retry", c.retry}
    };
}

void to_json(nlohmann::json& j, const IgnoreConfig& c) {
    j = {
        {"file_name", c.file_name},
        {"patterns", c.patterns}
    };
}

void to_json(nlohmann::json& j, const ChunkingConfig& c) {
    j = {{"max_chars", c.max_chars}};
}

void to_json(nlohmann::json& j, const EmbeddingConfig& c) {
    // the API key itself never lands in diagnostics, only the variable name
    j = {
        {"provider", c.provider},
        {"endpoint", c.endpoint},
        {"model", c.model},
        {"dimensions", c.dimensions},
        {"timeout_seconds", c.timeout_seconds},
        {"api_key_env", c.api_key_env},
        {"retry", c.retry}
    };
}

void to_json(nlohmann::json& j, const VectorIndexConfig& c) {
    j = {
        {"kind", c.kind},
        {"endpoint", c.endpoint},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const CryptoConfig& c) {
    j = {
        {"cipher", c.cipher},
        {"key_file", c.key_file.string()},
        {"key_id", c.key_id}
    };
}

void to_json(nlohmann::json& j, const StorageConfig& c) {
    j = {{"state_dir", c.state_dir.string()}};
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", spdlog::level::to_string_view(c.levels.console_log_level).data()},
        {"file_log_level", spdlog::level::to_string_view(c.levels.file_log_level).data()}
    };
}

}
