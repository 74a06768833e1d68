#pragma once
#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "tools/BackupJournal.hpp"
#include "shadow/ShadowInstanceManager.hpp"

namespace autopatch {

namespace fs = std::filesystem;

enum class RestartMode { EXEC, EXIT };

struct PipelineConfig {
    fs::path source_root;                       // default: current directory
    fs::path workspace_root = "data/workspace";
    fs::path backup_root = "data/backups";
    fs::path shadow_root = "data/shadow";
    fs::path audit_path = "data/audit.json";

    RetentionPolicy retention;
    ShadowSettings shadow;

    std::string verification_command = "python3 -m pytest -q";
    int verification_timeout_seconds = 300;
    std::vector<std::string> fail_markers = {"ERROR:", "FAILED:", "FAILURE:"};

    int busy_wait_ms = 0;

    RestartMode restart_mode = RestartMode::EXEC;
    int restart_exit_code = 3;

    std::string host = "0.0.0.0";
    int port = 5002;
    std::string log_level = "info";

    // Where the file was read from; empty when defaults were used.
    std::string loaded_from;
};

PipelineConfig default_pipeline_config();

// Overlays the keys present in `j` on the defaults. Throws
// nlohmann::json::exception on wrongly typed values.
PipelineConfig parse_pipeline_config(const nlohmann::json& j);

// Searches `explicit_path`, then $AUTOPATCH_CONFIG, then autopatch.json,
// ../autopatch.json and config/autopatch.json. A missing or malformed file
// is logged and yields the defaults.
PipelineConfig load_pipeline_config(const std::string& explicit_path = "");

}
