#include <gtest/gtest.h>
#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"
#include "TestProject.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

using namespace tl::config;

class ConfigTest : public TempProjectTest {
protected:
    [[nodiscard]] Config load(const std::string& yaml) const {
        writeFile("config.yaml", yaml);
        return loadConfig(root / "config.yaml");
    }
};

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    const auto cfg = load("{}\n");
    const Config defaults;

    EXPECT_EQ(cfg.server.port, defaults.server.port);
    EXPECT_EQ(cfg.client.server_url, "http://127.0.0.1:33380");
    EXPECT_TRUE(cfg.client.project_root.empty());
    EXPECT_EQ(cfg.client.push_batch_bytes, PUSH_BATCH_BYTES);
    EXPECT_EQ(cfg.sync.interval_seconds, 300u);
    EXPECT_EQ(cfg.sync.debounce_ms, 500u);
    EXPECT_EQ(cfg.sync.max_debounce_ms, 5000u);
    EXPECT_TRUE(cfg.sync.use_inotify);
    EXPECT_EQ(cfg.ignore.file_name, ".treelineignore");
    EXPECT_EQ(cfg.chunking.max_chars, 1500u);
    EXPECT_EQ(cfg.embedding.provider, "hashing");
    EXPECT_EQ(cfg.vector_index.kind, "file");
    EXPECT_EQ(cfg.crypto.cipher, "xchacha20poly1305");
}

TEST_F(ConfigTest, SectionsOverrideDefaults) {
    const auto cfg = load(R"(
server:
  host: 0.0.0.0
  port: 9000
  max_body_mb: 8
client:
  server_url: http://sync.internal:9000
  project_id: proj-1
  project_root: /srv/code
  push_batch_kb: 512
sync:
  interval_seconds: 60
  debounce_ms: 250
  max_debounce_ms: 3000
  use_inotify: false
  retry:
    max_attempts: 7
ignore:
  patterns: ["*.log", "dist/"]
chunking:
  max_chars: 800
embedding:
  provider: http
  dimensions: 1536
crypto:
  cipher: aes256gcm
  key_file: /etc/treeline/index.key
storage:
  state_dir: /var/lib/treeline
logging:
  log_levels:
    console_log_level: debug
    subsystem_levels:
      sync: trace
)");

    EXPECT_EQ(cfg.server.host, "0.0.0.0");
    EXPECT_EQ(cfg.server.port, 9000);
    EXPECT_EQ(cfg.server.max_body_bytes, 8u * 1024 * 1024);
    EXPECT_EQ(cfg.client.project_id, "proj-1");
    EXPECT_EQ(cfg.client.project_root.string(), "/srv/code");
    EXPECT_EQ(cfg.client.push_batch_bytes, 512u * 1024);
    EXPECT_EQ(cfg.sync.interval_seconds, 60u);
    EXPECT_EQ(cfg.sync.max_debounce_ms, 3000u);
    EXPECT_FALSE(cfg.sync.use_inotify);
    EXPECT_EQ(cfg.sync.retry.max_attempts, 7u);
    EXPECT_EQ(cfg.sync.retry.initial_delay_ms, 200u);
    EXPECT_EQ(cfg.ignore.patterns, (std::vector<std::string>{"*.log", "dist/"}));
    EXPECT_EQ(cfg.chunking.max_chars, 800u);
    EXPECT_EQ(cfg.embedding.provider, "http");
    EXPECT_EQ(cfg.embedding.dimensions, 1536u);
    EXPECT_EQ(cfg.embedding.model, "text-embedding-3-small");
    EXPECT_EQ(cfg.crypto.cipher, "aes256gcm");
    EXPECT_EQ(cfg.stateDir().string(), "/var/lib/treeline");
    EXPECT_EQ(cfg.keyFile().string(), "/etc/treeline/index.key");
    EXPECT_EQ(cfg.logging.levels.console_log_level, spdlog::level::debug);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.sync, spdlog::level::trace);
    EXPECT_EQ(cfg.logging.levels.subsystem_levels.fs, spdlog::level::warn);
}

TEST_F(ConfigTest, KeyFileDefaultsUnderStateDir) {
    const auto cfg = load("storage:\n  state_dir: /tmp/tl-state\n");
    EXPECT_EQ(cfg.keyFile().string(), "/tmp/tl-state/keys/index.key");
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    writeFile("config.yaml", "server: [unterminated\n");
    EXPECT_THROW(loadConfig(root / "config.yaml"), YAML::Exception);
}

TEST_F(ConfigTest, JsonViewCarriesEverySection) {
    Config cfg;
    const nlohmann::json j = cfg;
    EXPECT_EQ(j.at("embedding").at("api_key_env"), "TREELINE_EMBEDDING_API_KEY");
    EXPECT_EQ(j.at("server").at("port"), 33380);
    EXPECT_TRUE(j.contains("vector_index"));
}

TEST(ConfigRegistryTest, InitializedForTests) {
    EXPECT_NO_THROW(ConfigRegistry::get());
    EXPECT_EQ(ConfigRegistry::get().chunking.max_chars, 1500u);
}
