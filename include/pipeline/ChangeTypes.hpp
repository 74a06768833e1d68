#pragma once
#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace autopatch {

namespace fs = std::filesystem;

enum class ActorRole { RESTRICTED_TOOL, PRIVILEGED_ENGINEER };

enum class RootKind { SOURCE, WORKSPACE };

enum class ErrorKind {
    NONE,
    ACCESS_DENIED,
    OUT_OF_BOUNDS_PATH,
    INVALID_SYNTAX,
    BACKUP_IO_ERROR,
    SHADOW_SETUP_ERROR,
    SHADOW_TEST_FAILED,
    COMMIT_IO_ERROR,
    RUN_IN_PROGRESS,
    CANCELLED,
    RESTORE_FAILED
};

enum class RunState {
    PROPOSED,
    ACCESS_CHECKED,
    PATH_RESOLVED,
    VALIDATED,
    BACKED_UP,
    SHADOW_TESTED,
    COMMITTED,
    ROLLED_BACK,
    REJECTED,
    RESTART_REQUESTED
};

const char* to_string(ActorRole role);
const char* to_string(RootKind root);
const char* to_string(ErrorKind kind);
const char* to_string(RunState state);

std::optional<ActorRole> parse_role(const std::string& name);
std::optional<RootKind> parse_root(const std::string& name);

bool is_terminal(RunState state);

// Contract failure raised inside a pipeline component. The orchestrator
// converts it into a terminal run at the stage boundary.
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// An authorized directory boundary, canonical and immutable once built.
struct SandboxRoot {
    RootKind kind;
    fs::path path;
};

struct ChangeProposal {
    ActorRole role = ActorRole::RESTRICTED_TOOL;
    RootKind root = RootKind::WORKSPACE;
    std::string relative_path;
    std::string content;
    std::string rationale;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

struct BackupRecord {
    std::string id;
    RootKind root = RootKind::WORKSPACE;
    std::string relative_path;
    fs::path original_path;
    fs::path backup_path;
    std::string checksum;           // sha256 hex of the original bytes, empty for create-records
    long long created_at_ms = 0;    // unix epoch milliseconds
    bool existed = true;            // false: restore means "delete the path"
    std::uintmax_t size = 0;

    nlohmann::json to_json() const;
    static BackupRecord from_json(const nlohmann::json& j);
};

struct ValidationResult {
    bool accepted = false;
    std::string language;
    std::string message;
    int line = 0;       // 1-based, 0 when unknown
    int column = 0;

    nlohmann::json to_json() const {
        return {
            {"accepted", accepted},
            {"language", language},
            {"message", message},
            {"line", line},
            {"column", column}
        };
    }
};

struct DiffStats {
    size_t added = 0;
    size_t removed = 0;
    size_t unchanged = 0;
    std::vector<std::string> preview;

    nlohmann::json to_json() const {
        return {{"added", added}, {"removed", removed}, {"unchanged", unchanged}, {"preview", preview}};
    }
};

struct StageTrace {
    RunState state;
    std::string detail;
    double duration_ms = 0.0;
};

// One complete attempt to propose, validate, test and commit a change.
struct OrchestrationRun {
    std::string run_id;
    ChangeProposal proposal;
    RunState state = RunState::PROPOSED;
    ErrorKind error = ErrorKind::NONE;
    std::string failed_stage;
    std::string diagnostic;
    std::optional<ValidationResult> validation;
    std::optional<BackupRecord> backup;
    std::string shadow_id;
    std::string shadow_report;
    bool shadow_retained = false;
    DiffStats diff;
    std::vector<StageTrace> trace;

    bool succeeded() const {
        return state == RunState::COMMITTED || state == RunState::RESTART_REQUESTED;
    }

    nlohmann::json to_json() const;
};

// Serializes for the wire and the audit file. Bytes that are not valid UTF-8
// (a Latin-1 source line in a diff preview) become U+FFFD instead of throwing.
std::string dump_lenient(const nlohmann::json& j, int indent = -1);

}
