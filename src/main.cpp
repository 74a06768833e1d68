#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <signal.h>

#include "agent/ChangeOrchestrator.hpp"
#include "agent/RestartSupervisor.hpp"
#include "pipeline/AuditLog.hpp"
#include "pipeline/PipelineConfig.hpp"
#include "shadow/ShadowInstanceManager.hpp"
#include "shadow/VerificationSuite.hpp"
#include "tools/BackupJournal.hpp"
#include "tools/FileSystemTools.hpp"
#include "tools/SandboxResolver.hpp"
#include "tools/ToolRegistry.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

httplib::Server* global_server_ptr = nullptr;
autopatch::RestartSupervisor* global_supervisor_ptr = nullptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_supervisor_ptr) {
        global_supervisor_ptr->interrupt();
    }
    if (global_server_ptr) {
        global_server_ptr->stop();
    }
}

class AutopatchServer {
public:
    AutopatchServer(const autopatch::PipelineConfig& cfg, std::vector<std::string> argv) : cfg_(cfg) {
        resolver_ = std::make_shared<autopatch::SandboxResolver>();
        roots_.source = autopatch::SandboxResolver::make_root(autopatch::RootKind::SOURCE, cfg_.source_root);
        roots_.workspace = autopatch::SandboxResolver::make_root(autopatch::RootKind::WORKSPACE, cfg_.workspace_root);

        journal_ = std::make_shared<autopatch::BackupJournal>(cfg_.backup_root, resolver_, roots_, cfg_.retention);

        autopatch::ShadowSettings shadow = cfg_.shadow;
        shadow.excluded_dirs.push_back(fs::absolute(cfg_.backup_root));
        shadow.excluded_dirs.push_back(roots_.workspace.path);
        if (cfg_.audit_path.has_parent_path()) shadow.excluded_dirs.push_back(fs::absolute(cfg_.audit_path.parent_path()));
        shadows_ = std::make_shared<autopatch::ShadowInstanceManager>(shadow, resolver_);
        auto suite = std::make_shared<autopatch::CommandVerificationSuite>(
            cfg_.verification_command, std::chrono::seconds(cfg_.verification_timeout_seconds), cfg_.fail_markers);
        auto audit = std::make_shared<autopatch::AuditLog>(cfg_.audit_path);

        autopatch::OrchestratorSettings settings;
        settings.busy_wait_ms = cfg_.busy_wait_ms;
        orchestrator_ = std::make_shared<autopatch::ChangeOrchestrator>(
            roots_, resolver_, journal_, shadows_, suite, audit, settings);

        std::unique_ptr<autopatch::IProcessLauncher> launcher;
        if (cfg_.restart_mode == autopatch::RestartMode::EXIT) {
            launcher = std::make_unique<autopatch::ExitLauncher>(cfg_.restart_exit_code);
        } else {
            launcher = std::make_unique<autopatch::ExecLauncher>(std::move(argv));
        }
        supervisor_ = std::make_shared<autopatch::RestartSupervisor>(std::move(launcher));
        auto orchestrator = orchestrator_;
        supervisor_->add_drain_hook("orchestrator", [orchestrator]() { orchestrator->begin_drain(); });
        orchestrator_->set_restart_supervisor(supervisor_);

        file_tools_ = std::make_shared<autopatch::FileSystemTools>(resolver_, roots_);
        tool_registry_ = std::make_shared<autopatch::ToolRegistry>();
        autopatch::register_file_tools(*tool_registry_, file_tools_);

        setup_routes();
    }

    int run() {
        global_server_ptr = &server_;
        global_supervisor_ptr = supervisor_.get();
        // The hand-off runs here, after listen() has returned and its workers are joined.
        int code = supervisor_->serve(
            [this]() {
                spdlog::info("🚀 autopatchd listening on {}:{}", cfg_.host, cfg_.port);
                if (!server_.listen(cfg_.host, cfg_.port)) {
                    spdlog::error("💥 Could not bind {}:{}", cfg_.host, cfg_.port);
                    return false;
                }
                return true;
            },
            [this]() { server_.stop(); });
        global_supervisor_ptr = nullptr;
        global_server_ptr = nullptr;
        return code;
    }

private:
    autopatch::PipelineConfig cfg_;
    httplib::Server server_;

    autopatch::SandboxRoots roots_;
    std::shared_ptr<autopatch::SandboxResolver> resolver_;
    std::shared_ptr<autopatch::BackupJournal> journal_;
    std::shared_ptr<autopatch::ShadowInstanceManager> shadows_;
    std::shared_ptr<autopatch::ChangeOrchestrator> orchestrator_;
    std::shared_ptr<autopatch::RestartSupervisor> supervisor_;
    std::shared_ptr<autopatch::FileSystemTools> file_tools_;
    std::shared_ptr<autopatch::ToolRegistry> tool_registry_;

    static void send_error(httplib::Response& res, int status, const std::string& message) {
        res.status = status;
        res.set_content(autopatch::dump_lenient(json({{"error", message}})), "application/json");
    }

    // --- ROUTE HANDLERS ---

    void handle_propose(const httplib::Request& req, httplib::Response& res) {
        json body;
        try {
            body = json::parse(req.body);
        } catch (const json::parse_error& e) {
            return send_error(res, 400, std::string("Invalid JSON: ") + e.what());
        }

        auto role = autopatch::parse_role(body.value("role", ""));
        auto root = autopatch::parse_root(body.value("root", ""));
        if (!role) return send_error(res, 400, "Unknown role");
        if (!root) return send_error(res, 400, "Unknown root");
        if (!body.contains("path") || !body.contains("content")) {
            return send_error(res, 400, "Fields 'path' and 'content' are required");
        }

        try {
            autopatch::ProposeOptions options;
            options.confirm_restart = body.value("confirm_restart", false);
            options.language_hint = body.value("language", "");
            if (body.contains("retain_shadow_on_failure")) {
                options.retain_shadow_on_failure = body["retain_shadow_on_failure"].get<bool>();
            }

            auto run = orchestrator_->propose_change(*role, *root,
                                                     body["path"].get<std::string>(),
                                                     body["content"].get<std::string>(),
                                                     body.value("rationale", ""),
                                                     options);
            res.set_content(autopatch::dump_lenient(run.to_json()), "application/json");
        } catch (const json::exception& e) {
            send_error(res, 400, std::string("Bad field type: ") + e.what());
        }
    }

    void handle_list_backups(const httplib::Request& req, httplib::Response& res) {
        auto root = autopatch::parse_root(req.has_param("root") ? req.get_param_value("root") : "source");
        if (!root) return send_error(res, 400, "Unknown root");
        std::string filter = req.has_param("path") ? req.get_param_value("path") : "";

        json list = json::array();
        for (const auto& rec : orchestrator_->list_backups(*root, filter)) list.push_back(rec.to_json());
        res.set_content(autopatch::dump_lenient(json({{"records", list}})), "application/json");
    }

    void handle_restore(const httplib::Request& req, httplib::Response& res) {
        std::string record_id;
        try {
            record_id = json::parse(req.body).at("record_id").get<std::string>();
        } catch (const json::exception& e) {
            return send_error(res, 400, std::string("Expected {\"record_id\": string}: ") + e.what());
        }
        auto result = orchestrator_->restore_backup(record_id);
        if (!result.success) res.status = 409;
        res.set_content(autopatch::dump_lenient(json({{"success", result.success}, {"message", result.message}})), "application/json");
    }

    void handle_restart(const httplib::Request& req, httplib::Response& res) {
        bool confirm = false;
        try {
            if (!req.body.empty()) confirm = json::parse(req.body).value("confirm", false);
        } catch (const json::exception& e) {
            return send_error(res, 400, std::string("Invalid JSON: ") + e.what());
        }
        auto outcome = orchestrator_->request_restart(confirm);
        res.set_content(autopatch::dump_lenient(json({{"accepted", outcome.accepted}, {"message", outcome.message}})), "application/json");
    }

    void handle_tool(const httplib::Request& req, httplib::Response& res) {
        std::string name = req.path_params.at("name");
        if (!tool_registry_->has_tool(name)) return send_error(res, 404, "Unknown tool '" + name + "'");
        json params;
        try {
            params = req.body.empty() ? json::object() : json::parse(req.body);
        } catch (const json::parse_error& e) {
            return send_error(res, 400, std::string("Invalid JSON: ") + e.what());
        }
        std::string output = tool_registry_->dispatch(name, params);
        bool failed = output.rfind("ERROR:", 0) == 0;
        if (failed) spdlog::warn("⚠️ [TOOL FAIL] {} | {}", name, output);
        res.set_content(autopatch::dump_lenient(json({{"tool", name}, {"ok", !failed}, {"output", output}})), "application/json");
    }

    void setup_routes() {
        server_.Post("/api/change/propose", [this](const httplib::Request& req, httplib::Response& res) {
            handle_propose(req, res);
        });
        server_.Get("/api/backups", [this](const httplib::Request& req, httplib::Response& res) {
            handle_list_backups(req, res);
        });
        server_.Post("/api/backups/restore", [this](const httplib::Request& req, httplib::Response& res) {
            handle_restore(req, res);
        });
        server_.Post("/api/backups/evict", [this](const httplib::Request&, httplib::Response& res) {
            size_t removed = orchestrator_->evict_backups();
            res.set_content(autopatch::dump_lenient(json({{"evicted", removed}})), "application/json");
        });
        server_.Post("/api/restart", [this](const httplib::Request& req, httplib::Response& res) {
            handle_restart(req, res);
        });
        server_.Post("/api/shadow/sweep", [this](const httplib::Request&, httplib::Response& res) {
            size_t removed = shadows_->sweep();
            res.set_content(autopatch::dump_lenient(json({{"removed", removed}})), "application/json");
        });
        server_.Get("/api/audit", [this](const httplib::Request& req, httplib::Response& res) {
            size_t limit = 50;
            if (req.has_param("limit")) {
                try {
                    limit = std::stoul(req.get_param_value("limit"));
                } catch (const std::exception&) {
                    return send_error(res, 400, "limit must be a number");
                }
            }
            res.set_content(autopatch::dump_lenient(json({{"runs", orchestrator_->audit()->recent_runs(limit)}})), "application/json");
        });
        server_.Get("/api/tools", [this](const httplib::Request&, httplib::Response& res) {
            res.set_content(tool_registry_->get_manifest(), "application/json");
        });
        server_.Post("/api/tools/:name", [this](const httplib::Request& req, httplib::Response& res) {
            handle_tool(req, res);
        });
        server_.Get("/api/hello", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status": "nominal"})", "application/json");
        });

        server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
            std::string what = "unknown error";
            try {
                std::rethrow_exception(ep);
            } catch (const std::exception& e) {
                what = e.what();
            } catch (...) {
                what = "non-standard exception";
            }
            spdlog::error("💥 Handler for {} crashed: {}", req.path, what);
            res.status = 500;
            res.set_content(autopatch::dump_lenient(json({{"error", what}})), "application/json");
        });
    }
};

// Backups must never be discoverable as source files.
void pre_flight_check(const autopatch::PipelineConfig& cfg) {
    std::error_code ec;
    auto backups = fs::weakly_canonical(fs::absolute(cfg.backup_root), ec);
    for (const auto& root : {cfg.source_root, cfg.workspace_root}) {
        auto r = fs::weakly_canonical(fs::absolute(root), ec);
        if (!ec && autopatch::SandboxResolver::is_inside(backups, r)) {
            spdlog::warn("⚠️ backup_root {} lies inside {}; records will show up in listings and shadow copies",
                         backups.string(), r.string());
        }
    }
    if (cfg.verification_command.empty()) {
        spdlog::warn("⚠️ verification.command is empty; every proposal will fail its shadow test");
    }
}

int main(int argc, char** argv) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::vector<std::string> args(argv, argv + argc);
    std::string config_path = argc > 1 ? args[1] : "";
    autopatch::PipelineConfig cfg = autopatch::load_pipeline_config(config_path);
    spdlog::set_level(spdlog::level::from_str(cfg.log_level));

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    pre_flight_check(cfg);

    try {
        AutopatchServer app(cfg, args);
        return app.run(); // This blocks
    } catch (const std::exception& e) {
        spdlog::critical("💥 Startup failed: {}", e.what());
        return 1;
    }
}
