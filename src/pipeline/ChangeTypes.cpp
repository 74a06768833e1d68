#include "pipeline/ChangeTypes.hpp"

namespace autopatch {

const char* to_string(ActorRole role) {
    switch (role) {
        case ActorRole::RESTRICTED_TOOL: return "restricted_tool";
        case ActorRole::PRIVILEGED_ENGINEER: return "privileged_engineer";
    }
    return "unknown";
}

const char* to_string(RootKind root) {
    switch (root) {
        case RootKind::SOURCE: return "source";
        case RootKind::WORKSPACE: return "workspace";
    }
    return "unknown";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "None";
        case ErrorKind::ACCESS_DENIED: return "AccessDenied";
        case ErrorKind::OUT_OF_BOUNDS_PATH: return "OutOfBoundsPath";
        case ErrorKind::INVALID_SYNTAX: return "InvalidSyntax";
        case ErrorKind::BACKUP_IO_ERROR: return "BackupIOError";
        case ErrorKind::SHADOW_SETUP_ERROR: return "ShadowSetupError";
        case ErrorKind::SHADOW_TEST_FAILED: return "ShadowTestFailed";
        case ErrorKind::COMMIT_IO_ERROR: return "CommitIOError";
        case ErrorKind::RUN_IN_PROGRESS: return "RunInProgress";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::RESTORE_FAILED: return "RestoreFailed";
    }
    return "Unknown";
}

const char* to_string(RunState state) {
    switch (state) {
        case RunState::PROPOSED: return "Proposed";
        case RunState::ACCESS_CHECKED: return "AccessChecked";
        case RunState::PATH_RESOLVED: return "PathResolved";
        case RunState::VALIDATED: return "Validated";
        case RunState::BACKED_UP: return "BackedUp";
        case RunState::SHADOW_TESTED: return "ShadowTested";
        case RunState::COMMITTED: return "Committed";
        case RunState::ROLLED_BACK: return "RolledBack";
        case RunState::REJECTED: return "Rejected";
        case RunState::RESTART_REQUESTED: return "RestartRequested";
    }
    return "Unknown";
}

std::optional<ActorRole> parse_role(const std::string& name) {
    if (name == "restricted_tool" || name == "tool") return ActorRole::RESTRICTED_TOOL;
    if (name == "privileged_engineer" || name == "engineer") return ActorRole::PRIVILEGED_ENGINEER;
    return std::nullopt;
}

std::optional<RootKind> parse_root(const std::string& name) {
    if (name == "source") return RootKind::SOURCE;
    if (name == "workspace") return RootKind::WORKSPACE;
    return std::nullopt;
}

bool is_terminal(RunState state) {
    return state == RunState::COMMITTED || state == RunState::ROLLED_BACK ||
           state == RunState::REJECTED || state == RunState::RESTART_REQUESTED;
}

nlohmann::json BackupRecord::to_json() const {
    return {
        {"id", id},
        {"root", to_string(root)},
        {"relative_path", relative_path},
        {"original_path", original_path.string()},
        {"backup_path", backup_path.string()},
        {"checksum", checksum},
        {"created_at_ms", created_at_ms},
        {"existed", existed},
        {"size", size}
    };
}

BackupRecord BackupRecord::from_json(const nlohmann::json& j) {
    BackupRecord r;
    r.id = j.at("id").get<std::string>();
    r.root = parse_root(j.value("root", "workspace")).value_or(RootKind::WORKSPACE);
    r.relative_path = j.value("relative_path", "");
    r.original_path = j.value("original_path", "");
    r.backup_path = j.value("backup_path", "");
    r.checksum = j.value("checksum", "");
    r.created_at_ms = j.value("created_at_ms", 0LL);
    r.existed = j.value("existed", true);
    r.size = j.value("size", static_cast<std::uintmax_t>(0));
    return r;
}

nlohmann::json OrchestrationRun::to_json() const {
    auto ts = std::chrono::duration_cast<std::chrono::milliseconds>(
        proposal.timestamp.time_since_epoch()).count();

    nlohmann::json stages = nlohmann::json::array();
    for (const auto& t : trace) {
        stages.push_back({{"state", to_string(t.state)}, {"detail", t.detail}, {"duration_ms", t.duration_ms}});
    }

    nlohmann::json j = {
        {"run_id", run_id},
        {"role", to_string(proposal.role)},
        {"root", to_string(proposal.root)},
        {"path", proposal.relative_path},
        {"rationale", proposal.rationale},
        {"timestamp_ms", static_cast<long long>(ts)},
        {"state", to_string(state)},
        {"success", succeeded()},
        {"error", to_string(error)},
        {"stage", failed_stage},
        {"diagnostic", diagnostic},
        {"diff", diff.to_json()},
        {"shadow_id", shadow_id},
        {"shadow_retained", shadow_retained},
        {"shadow_report", shadow_report},
        {"trace", stages}
    };
    j["validation"] = validation ? validation->to_json() : nlohmann::json(nullptr);
    j["backup"] = backup ? backup->to_json() : nlohmann::json(nullptr);
    return j;
}

std::string dump_lenient(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}
