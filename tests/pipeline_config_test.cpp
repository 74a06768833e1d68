#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "pipeline/PipelineConfig.hpp"
#include <spdlog/spdlog.h>

using namespace autopatch;
using autopatch::testing::write_text;

TEST(PipelineConfigTest, DefaultsAreConservative) {
    auto cfg = default_pipeline_config();
    EXPECT_EQ(cfg.source_root, fs::current_path());
    EXPECT_EQ(cfg.workspace_root, fs::path("data/workspace"));
    EXPECT_EQ(cfg.shadow.shadow_root, cfg.shadow_root);
    EXPECT_FALSE(cfg.shadow.retain_on_failure);
    EXPECT_EQ(cfg.busy_wait_ms, 0);
    EXPECT_EQ(cfg.restart_mode, RestartMode::EXEC);
    EXPECT_EQ(cfg.port, 5002);
    EXPECT_FALSE(cfg.verification_command.empty());
    EXPECT_TRUE(cfg.loaded_from.empty());
}

TEST(PipelineConfigTest, KeysOverlayTheDefaults) {
    auto j = nlohmann::json::parse(R"({
        "source_root": "/srv/app",
        "shadow_root": "/tmp/shadows",
        "retention": {"max_records": 5},
        "shadow": {"retain_on_failure": true, "ignore": [".git"]},
        "verification": {"command": "make check", "timeout_seconds": 30},
        "orchestrator": {"busy_wait_ms": 250},
        "restart": {"mode": "exit", "exit_code": 42},
        "server": {"port": 6000},
        "log_level": "debug"
    })");
    auto cfg = parse_pipeline_config(j);

    EXPECT_EQ(cfg.source_root, fs::path("/srv/app"));
    EXPECT_EQ(cfg.shadow.shadow_root, fs::path("/tmp/shadows"));
    EXPECT_EQ(cfg.retention.max_records, 5u);
    EXPECT_TRUE(cfg.shadow.retain_on_failure);
    EXPECT_EQ(cfg.shadow.ignore_patterns, std::vector<std::string>{".git"});
    EXPECT_EQ(cfg.verification_command, "make check");
    EXPECT_EQ(cfg.verification_timeout_seconds, 30);
    EXPECT_EQ(cfg.busy_wait_ms, 250);
    EXPECT_EQ(cfg.restart_mode, RestartMode::EXIT);
    EXPECT_EQ(cfg.restart_exit_code, 42);
    EXPECT_EQ(cfg.port, 6000);
    EXPECT_EQ(cfg.host, "0.0.0.0");
    EXPECT_EQ(cfg.log_level, "debug");
    // Untouched keys keep their defaults.
    EXPECT_EQ(cfg.backup_root, fs::path("data/backups"));
}

TEST(PipelineConfigTest, UnknownRestartModeFallsBackToExec) {
    auto cfg = parse_pipeline_config(nlohmann::json::parse(R"({"restart": {"mode": "reboot"}})"));
    EXPECT_EQ(cfg.restart_mode, RestartMode::EXEC);
}

TEST(PipelineConfigTest, UnknownLogLevelKeepsLoggingOn) {
    auto cfg = parse_pipeline_config(nlohmann::json::parse(R"({"log_level": "verbose"})"));
    EXPECT_EQ(cfg.log_level, default_pipeline_config().log_level);
    EXPECT_NE(spdlog::level::from_str(cfg.log_level), spdlog::level::off);

    EXPECT_EQ(parse_pipeline_config(nlohmann::json::parse(R"({"log_level": "warn"})")).log_level, "warn");
    EXPECT_EQ(parse_pipeline_config(nlohmann::json::parse(R"({"log_level": "off"})")).log_level, "off");
}

TEST(PipelineConfigTest, WronglyTypedValueThrows) {
    EXPECT_THROW(parse_pipeline_config(nlohmann::json::parse(R"({"source_root": 7})")), nlohmann::json::exception);
}

class PipelineConfigFileTest : public autopatch::testing::SandboxTest {};

TEST_F(PipelineConfigFileTest, ExplicitPathIsLoaded) {
    fs::path file = base_ / "custom.json";
    write_text(file, R"({"verification": {"command": "ctest"}, "server": {"host": "127.0.0.1"}})");

    auto cfg = load_pipeline_config(file.string());
    EXPECT_EQ(cfg.verification_command, "ctest");
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.loaded_from, file.string());
}

TEST_F(PipelineConfigFileTest, MalformedFileYieldsDefaults) {
    fs::path file = base_ / "broken.json";
    write_text(file, "{ not json");

    auto cfg = load_pipeline_config(file.string());
    EXPECT_TRUE(cfg.loaded_from.empty());
    EXPECT_EQ(cfg.port, 5002);
}

TEST_F(PipelineConfigFileTest, MissingExplicitFileYieldsDefaults) {
    auto cfg = load_pipeline_config((base_ / "absent.json").string());
    EXPECT_TRUE(cfg.loaded_from.empty());
    EXPECT_EQ(cfg.restart_mode, RestartMode::EXEC);
}
