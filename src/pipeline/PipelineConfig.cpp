#include "pipeline/PipelineConfig.hpp"
#include <cstdlib>
#include <fstream>
#include <spdlog/spdlog.h>

namespace autopatch {

PipelineConfig default_pipeline_config() {
    PipelineConfig cfg;
    std::error_code ec;
    cfg.source_root = fs::current_path(ec);
    if (ec) cfg.source_root = ".";
    cfg.shadow.shadow_root = cfg.shadow_root;
    return cfg;
}

PipelineConfig parse_pipeline_config(const nlohmann::json& j) {
    PipelineConfig cfg = default_pipeline_config();

    if (j.contains("source_root")) cfg.source_root = j["source_root"].get<std::string>();
    if (j.contains("workspace_root")) cfg.workspace_root = j["workspace_root"].get<std::string>();
    if (j.contains("backup_root")) cfg.backup_root = j["backup_root"].get<std::string>();
    if (j.contains("shadow_root")) cfg.shadow_root = j["shadow_root"].get<std::string>();
    if (j.contains("audit_path")) cfg.audit_path = j["audit_path"].get<std::string>();

    if (j.contains("retention")) {
        const auto& r = j["retention"];
        cfg.retention.max_records = r.value("max_records", cfg.retention.max_records);
        cfg.retention.max_age_seconds = r.value("max_age_seconds", cfg.retention.max_age_seconds);
    }

    cfg.shadow.shadow_root = cfg.shadow_root;
    if (j.contains("shadow")) {
        const auto& s = j["shadow"];
        cfg.shadow.retain_on_failure = s.value("retain_on_failure", cfg.shadow.retain_on_failure);
        if (s.contains("ignore")) cfg.shadow.ignore_patterns = s["ignore"].get<std::vector<std::string>>();
    }

    if (j.contains("verification")) {
        const auto& v = j["verification"];
        cfg.verification_command = v.value("command", cfg.verification_command);
        cfg.verification_timeout_seconds = v.value("timeout_seconds", cfg.verification_timeout_seconds);
        if (v.contains("fail_markers")) cfg.fail_markers = v["fail_markers"].get<std::vector<std::string>>();
    }

    if (j.contains("orchestrator")) {
        cfg.busy_wait_ms = j["orchestrator"].value("busy_wait_ms", cfg.busy_wait_ms);
    }

    if (j.contains("restart")) {
        const auto& r = j["restart"];
        std::string mode = r.value("mode", std::string("exec"));
        if (mode == "exec") {
            cfg.restart_mode = RestartMode::EXEC;
        } else if (mode == "exit") {
            cfg.restart_mode = RestartMode::EXIT;
        } else {
            spdlog::warn("⚠️ Unknown restart.mode '{}', using exec", mode);
        }
        cfg.restart_exit_code = r.value("exit_code", cfg.restart_exit_code);
    }

    if (j.contains("server")) {
        cfg.host = j["server"].value("host", cfg.host);
        cfg.port = j["server"].value("port", cfg.port);
    }
    std::string level = j.value("log_level", cfg.log_level);
    // from_str maps anything it does not know to "off".
    if (level != "off" && spdlog::level::from_str(level) == spdlog::level::off) {
        spdlog::warn("⚠️ Unknown log_level '{}', using {}", level, cfg.log_level);
    } else {
        cfg.log_level = level;
    }
    return cfg;
}

PipelineConfig load_pipeline_config(const std::string& explicit_path) {
    std::vector<std::string> search_paths;
    if (!explicit_path.empty()) {
        search_paths.push_back(explicit_path);
    } else {
        if (const char* env = std::getenv("AUTOPATCH_CONFIG")) search_paths.push_back(env);
        search_paths.insert(search_paths.end(), {"autopatch.json", "../autopatch.json", "config/autopatch.json"});
    }

    std::ifstream f;
    std::string found;
    for (const auto& path : search_paths) {
        f.open(path);
        if (f.is_open()) {
            found = path;
            break;
        }
    }

    if (!f.is_open()) {
        spdlog::warn("⚙️ autopatch.json not found, using defaults");
        return default_pipeline_config();
    }

    try {
        auto j = nlohmann::json::parse(f);
        PipelineConfig cfg = parse_pipeline_config(j);
        cfg.loaded_from = found;
        spdlog::info("⚙️ Config loaded from {}", found);
        return cfg;
    } catch (const std::exception& e) {
        spdlog::error("💥 Failed to parse {}: {}. Using defaults.", found, e.what());
        return default_pipeline_config();
    }
}

}
