#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace tl::config;

template<>
struct convert<ServerConfig> {
    static Node encode(const ServerConfig& rhs) {
        Node node;
        node["host"] = rhs.host;
        node["port"] = rhs.port;
        node["max_body_mb"] = rhs.max_body_bytes / (1024 * 1024);
        return node;
    }

    static bool decode(const Node& node, ServerConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.host = node["host"].as<std::string>("127.0.0.1");
        rhs.port = node["port"].as<uint16_t>(33380);
        rhs.max_body_bytes = node["max_body_mb"].as<uintmax_t>(64) * 1024 * 1024;
        return true;
    }
};

template<>
struct convert<ClientConfig> {
    static Node encode(const ClientConfig& rhs) {
        Node node;
        node["server_url"] = rhs.server_url;
        node["project_id"] = rhs.project_id;
        node["project_name"] = rhs.project_name;
        node["project_root"] = rhs.project_root.string();
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["push_batch_kb"] = rhs.push_batch_bytes / 1024;
        return node;
    }

    static bool decode(const Node& node, ClientConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.server_url = node["server_url"].as<std::string>("http://127.0.0.1:33380");
        rhs.project_id = node["project_id"].as<std::string>("");
        rhs.project_name = node["project_name"].as<std::string>("");
        rhs.project_root = node["project_root"].as<std::string>("");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(10);
        rhs.push_batch_bytes = node["push_batch_kb"].as<uintmax_t>(4096) * 1024;
        return true;
    }
};

template<>
struct convert<RetryConfig> {
    static Node encode(const RetryConfig& rhs) {
        Node node;
        node["max_attempts"] = rhs.max_attempts;
        node["initial_delay_ms"] = rhs.initial_delay_ms;
        node["max_delay_ms"] = rhs.max_delay_ms;
        return node;
    }

    static bool decode(const Node& node, RetryConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_attempts = node["max_attempts"].as<unsigned int>(4);
        rhs.initial_delay_ms = node["initial_delay_ms"].as<unsigned int>(200);
        rhs.max_delay_ms = node["max_delay_ms"].as<unsigned int>(5000);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["interval_seconds"] = rhs.interval_seconds;
        node["debounce_ms"] = rhs.debounce_ms;
        node["max_debounce_ms"] = rhs.max_debounce_ms;
        node["use_inotify"] = rhs.use_inotify;
        node["retry"] = rhs.retry;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.interval_seconds = node["interval_seconds"].as<unsigned int>(300);
        rhs.debounce_ms = node["debounce_ms"].as<unsigned int>(500);
        rhs.max_debounce_ms = node["max_debounce_ms"].as<unsigned int>(5000);
        rhs.use_inotify = node["use_inotify"].as<bool>(true);
        if (node["retry"]) rhs.retry = node["retry"].as<RetryConfig>();
        return true;
    }
};

template<>
struct convert<IgnoreConfig> {
    static Node encode(const IgnoreConfig& rhs) {
        Node node;
        node["file_name"] = rhs.file_name;
        node["patterns"] = rhs.patterns;
        return node;
    }

    static bool decode(const Node& node, IgnoreConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.file_name = node["file_name"].as<std::string>(".treelineignore");
        if (node["patterns"]) rhs.patterns = node["patterns"].as<std::vector<std::string>>();
        return true;
    }
};

template<>
struct convert<ChunkingConfig> {
    static Node encode(const ChunkingConfig& rhs) {
        Node node;
        node["max_chars"] = rhs.max_chars;
        return node;
    }

    static bool decode(const Node& node, ChunkingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.max_chars = node["max_chars"].as<unsigned int>(1500);
        return true;
    }
};

template<>
struct convert<EmbeddingConfig> {
    static Node encode(const EmbeddingConfig& rhs) {
        Node node;
        node["provider"] = rhs.provider;
        node["endpoint"] = rhs.endpoint;
        node["model"] = rhs.model;
        node["dimensions"] = rhs.dimensions;
        node["timeout_seconds"] = rhs.timeout_seconds;
        node["api_key_env"] = rhs.api_key_env;
        node["retry"] = rhs.retry;
        return node;
    }

    static bool decode(const Node& node, EmbeddingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.provider = node["provider"].as<std::string>("hashing");
        rhs.endpoint = node["endpoint"].as<std::string>("http://127.0.0.1:8080/v1/embeddings");
        rhs.model = node["model"].as<std::string>("text-embedding-3-small");
        rhs.dimensions = node["dimensions"].as<unsigned int>(256);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        rhs.api_key_env = node["api_key_env"].as<std::string>("TREELINE_EMBEDDING_API_KEY");
        if (node["retry"]) rhs.retry = node["retry"].as<RetryConfig>();
        return true;
    }
};

template<>
struct convert<VectorIndexConfig> {
    static Node encode(const VectorIndexConfig& rhs) {
        Node node;
        node["kind"] = rhs.kind;
        node["endpoint"] = rhs.endpoint;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, VectorIndexConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.kind = node["kind"].as<std::string>("file");
        rhs.endpoint = node["endpoint"].as<std::string>("http://127.0.0.1:33381");
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(10);
        return true;
    }
};

template<>
struct convert<CryptoConfig> {
    static Node encode(const CryptoConfig& rhs) {
        Node node;
        node["cipher"] = rhs.cipher;
        node["key_file"] = rhs.key_file.string();
        node["key_id"] = rhs.key_id;
        return node;
    }

    static bool decode(const Node& node, CryptoConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cipher = node["cipher"].as<std::string>("xchacha20poly1305");
        rhs.key_file = node["key_file"].as<std::string>("");
        rhs.key_id = node["key_id"].as<std::string>("");
        return true;
    }
};

template<>
struct convert<StorageConfig> {
    static Node encode(const StorageConfig& rhs) {
        Node node;
        node["state_dir"] = rhs.state_dir.string();
        return node;
    }

    static bool decode(const Node& node, StorageConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.state_dir = node["state_dir"].as<std::string>("");
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["treeline"] = to_std_string(spdlog::level::to_string_view(rhs.treeline));
        node["fs"]       = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["merkle"]   = to_std_string(spdlog::level::to_string_view(rhs.merkle));
        node["sync"]     = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["crypto"]   = to_std_string(spdlog::level::to_string_view(rhs.crypto));
        node["embed"]    = to_std_string(spdlog::level::to_string_view(rhs.embed));
        node["index"]    = to_std_string(spdlog::level::to_string_view(rhs.index));
        node["watch"]    = to_std_string(spdlog::level::to_string_view(rhs.watch));
        node["http"]     = to_std_string(spdlog::level::to_string_view(rhs.http));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.treeline = spdlog::level::from_str(node["treeline"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("warn"));
        rhs.merkle = spdlog::level::from_str(node["merkle"].as<std::string>("warn"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.embed = spdlog::level::from_str(node["embed"].as<std::string>("warn"));
        rhs.index = spdlog::level::from_str(node["index"].as<std::string>("warn"));
        rhs.watch = spdlog::level::from_str(node["watch"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
