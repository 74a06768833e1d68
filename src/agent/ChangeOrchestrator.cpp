#include "agent/ChangeOrchestrator.hpp"
#include "pipeline/AccessPolicy.hpp"
#include "utils/DiffSummary.hpp"
#include "utils/FileIO.hpp"
#include <spdlog/spdlog.h>

namespace autopatch {

void AtomicFileWriter::write(const fs::path& target, const std::string& content) {
    write_file_atomic(target, content);
}

ChangeOrchestrator::ChangeOrchestrator(SandboxRoots roots,
                                       std::shared_ptr<const SandboxResolver> resolver,
                                       std::shared_ptr<BackupJournal> journal,
                                       std::shared_ptr<ShadowInstanceManager> shadows,
                                       std::shared_ptr<IVerificationSuite> suite,
                                       std::shared_ptr<AuditLog> audit,
                                       OrchestratorSettings settings,
                                       std::shared_ptr<IFileWriter> writer)
    : roots_(std::move(roots)),
      resolver_(std::move(resolver)),
      journal_(std::move(journal)),
      shadows_(std::move(shadows)),
      suite_(std::move(suite)),
      audit_(audit ? std::move(audit) : std::make_shared<AuditLog>()),
      settings_(settings),
      writer_(writer ? std::move(writer) : std::make_shared<AtomicFileWriter>()) {
    if (!resolver_ || !journal_ || !shadows_ || !suite_) {
        throw std::invalid_argument("ChangeOrchestrator: resolver, journal, shadow manager and suite are required");
    }
    spdlog::info("🧭 Orchestrator ready. source={} workspace={} suite='{}'",
                 roots_.source.path.string(), roots_.workspace.path.string(), suite_->name());
}

void ChangeOrchestrator::set_restart_supervisor(std::shared_ptr<RestartSupervisor> supervisor) {
    supervisor_ = std::move(supervisor);
}

bool ChangeOrchestrator::try_acquire_root(RootKind root, std::string& reason) {
    std::unique_lock<std::mutex> lock(lease_mtx_);
    if (settings_.busy_wait_ms > 0) {
        lease_cv_.wait_for(lock, std::chrono::milliseconds(settings_.busy_wait_ms),
                           [&] { return draining_.load() || busy_roots_.count(root) == 0; });
    }
    if (draining_.load()) {
        reason = "Pipeline is draining for a restart";
        return false;
    }
    if (busy_roots_.count(root)) {
        reason = std::string("Another run is in flight on the ") + to_string(root) + " root";
        return false;
    }
    busy_roots_.insert(root);
    return true;
}

void ChangeOrchestrator::release_root(RootKind root) {
    {
        std::lock_guard<std::mutex> lock(lease_mtx_);
        busy_roots_.erase(root);
    }
    lease_cv_.notify_all();
}

size_t ChangeOrchestrator::in_flight() const {
    std::lock_guard<std::mutex> lock(lease_mtx_);
    return busy_roots_.size();
}

bool ChangeOrchestrator::begin_drain(std::chrono::milliseconds timeout) {
    draining_ = true;
    lease_cv_.notify_all();
    spdlog::warn("🚰 Draining orchestrator: new runs are refused");
    std::unique_lock<std::mutex> lock(lease_mtx_);
    bool idle = lease_cv_.wait_for(lock, timeout, [this] { return busy_roots_.empty(); });
    if (!idle) spdlog::error("⏱️ Drain timed out with {} run(s) still active", busy_roots_.size());
    return idle;
}

void ChangeOrchestrator::end_drain() {
    draining_ = false;
    lease_cv_.notify_all();
}

void ChangeOrchestrator::advance(OrchestrationRun& run, RunState next, const std::string& detail,
                                 std::chrono::steady_clock::time_point& stage_start) {
    auto now = std::chrono::steady_clock::now();
    double ms = std::chrono::duration<double, std::milli>(now - stage_start).count();
    stage_start = now;
    run.state = next;
    run.trace.push_back({next, detail, ms});
    spdlog::info("➡️ [{}] {} ({:.2f} ms) {}", run.run_id, to_string(next), ms, detail);
}

void ChangeOrchestrator::finish_failed(OrchestrationRun& run, RunState stage, ErrorKind kind,
                                       const std::string& diagnostic) {
    run.error = kind;
    run.failed_stage = to_string(stage);
    run.diagnostic = diagnostic;
    // Nothing was planned for mutation until a backup exists.
    run.state = run.backup ? RunState::ROLLED_BACK : RunState::REJECTED;
    run.trace.push_back({run.state, diagnostic, 0.0});

    switch (kind) {
        case ErrorKind::BACKUP_IO_ERROR:
        case ErrorKind::SHADOW_SETUP_ERROR:
        case ErrorKind::COMMIT_IO_ERROR:
            spdlog::error("❌ [{}] {} at {}: {}", run.run_id, to_string(kind), run.failed_stage, diagnostic);
            break;
        default:
            spdlog::warn("🛑 [{}] {} at {}: {}", run.run_id, to_string(kind), run.failed_stage, diagnostic);
            break;
    }
}

void ChangeOrchestrator::commit(OrchestrationRun& run, const BackupRecord& backup) {
    // Resolved again right before the write; a link swapped since the
    // PathResolved stage is caught here.
    fs::path target = resolver_->resolve(roots_.get(run.proposal.root), run.proposal.relative_path);
    try {
        fs::create_directories(target.parent_path());
        writer_->write(target, run.proposal.content);
    } catch (const std::exception& e) {
        spdlog::critical("💥 [{}] Real write of {} failed: {}. Restoring {}",
                         run.run_id, target.string(), e.what(), backup.id);
        RestoreResult restored = journal_->restore(backup);
        if (!restored.success) {
            throw PipelineError(ErrorKind::COMMIT_IO_ERROR,
                                std::string("Commit failed (") + e.what() + ") and restore failed: " + restored.message);
        }
        throw PipelineError(ErrorKind::COMMIT_IO_ERROR,
                            std::string("Commit failed, original restored: ") + e.what());
    }
}

OrchestrationRun ChangeOrchestrator::propose_change(ActorRole role, RootKind root,
                                                    const std::string& relative_path,
                                                    const std::string& content,
                                                    const std::string& rationale,
                                                    const ProposeOptions& options) {
    ChangeProposal proposal;
    proposal.role = role;
    proposal.root = root;
    proposal.relative_path = relative_path;
    proposal.content = content;
    proposal.rationale = rationale;
    proposal.timestamp = std::chrono::system_clock::now();
    return propose_change(proposal, options);
}

OrchestrationRun ChangeOrchestrator::propose_change(const ChangeProposal& proposal, const ProposeOptions& options) {
    OrchestrationRun run;
    run.run_id = "run-" + utc_stamp() + "-" + std::to_string(run_seq_++);
    run.proposal = proposal;
    run.state = RunState::PROPOSED;
    run.trace.push_back({RunState::PROPOSED, proposal.rationale, 0.0});

    spdlog::info("📥 [{}] {} proposes {} in {} root ({} bytes)", run.run_id, to_string(proposal.role),
                 proposal.relative_path, to_string(proposal.root), proposal.content.size());

    const CancellationToken& cancel = options.cancel;
    auto stage_start = std::chrono::steady_clock::now();
    RunState stage = RunState::ACCESS_CHECKED;
    std::optional<RootLease> lease;
    std::optional<BackupPin> pin;

    auto check_cancel = [&]() {
        if (cancel.is_cancelled()) {
            throw PipelineError(ErrorKind::CANCELLED, std::string("Cancelled before ") + to_string(stage));
        }
    };

    try {
        // No filesystem I/O happens before the role table says yes.
        GuardResult guard = AccessPolicy::check_write(proposal.role, proposal.root);
        if (!guard.allowed) throw PipelineError(ErrorKind::ACCESS_DENIED, guard.reason);

        std::string busy_reason;
        if (!try_acquire_root(proposal.root, busy_reason)) {
            throw PipelineError(ErrorKind::RUN_IN_PROGRESS, busy_reason);
        }
        lease.emplace(this, proposal.root);
        check_cancel();
        advance(run, RunState::ACCESS_CHECKED, guard.reason, stage_start);

        stage = RunState::PATH_RESOLVED;
        const SandboxRoot& root = roots_.get(proposal.root);
        fs::path target = resolver_->resolve(root, proposal.relative_path);
        check_cancel();
        advance(run, RunState::PATH_RESOLVED, target.string(), stage_start);

        stage = RunState::VALIDATED;
        {
            std::lock_guard<std::mutex> lock(validator_mtx_);
            run.validation = validator_.validate(proposal.content, options.language_hint, proposal.relative_path);
        }
        std::string current;
        try {
            std::error_code ec;
            if (fs::is_regular_file(target, ec)) current = read_file_bytes(target);
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ [{}] Diff skipped, cannot read current file: {}", run.run_id, e.what());
        }
        run.diff = summarize_diff(current, proposal.content);
        if (!run.validation->accepted) {
            std::string where;
            if (run.validation->line > 0) {
                where = " (line " + std::to_string(run.validation->line) + ", column " +
                        std::to_string(run.validation->column) + ")";
            }
            throw PipelineError(ErrorKind::INVALID_SYNTAX, run.validation->message + where);
        }
        check_cancel();
        advance(run, RunState::VALIDATED, run.validation->language, stage_start);

        stage = RunState::BACKED_UP;
        BackupRecord record = journal_->snapshot(root, proposal.relative_path);
        run.backup = record;
        pin.emplace(journal_.get(), record.id);
        check_cancel();
        advance(run, RunState::BACKED_UP, record.id, stage_start);

        stage = RunState::SHADOW_TESTED;
        ShadowReport report = shadows_->run_shadow(root, proposal, *suite_, cancel, options.retain_shadow_on_failure);
        run.shadow_id = report.instance_id;
        run.shadow_report = report.report;
        run.shadow_retained = report.retained;
        check_cancel();
        if (!report.passed) {
            throw PipelineError(ErrorKind::SHADOW_TEST_FAILED,
                                report.timed_out ? "Verification suite timed out" : "Verification suite failed");
        }
        advance(run, RunState::SHADOW_TESTED, report.instance_id, stage_start);

        stage = RunState::COMMITTED;
        check_cancel();
        commit(run, record);
        advance(run, RunState::COMMITTED, target.string(), stage_start);
    } catch (const PipelineError& e) {
        finish_failed(run, stage, e.kind(), e.what());
    } catch (const std::exception& e) {
        ErrorKind kind = ErrorKind::COMMIT_IO_ERROR;
        switch (stage) {
            case RunState::ACCESS_CHECKED:
            case RunState::PATH_RESOLVED: kind = ErrorKind::OUT_OF_BOUNDS_PATH; break;
            case RunState::VALIDATED: kind = ErrorKind::INVALID_SYNTAX; break;
            case RunState::BACKED_UP: kind = ErrorKind::BACKUP_IO_ERROR; break;
            case RunState::SHADOW_TESTED: kind = ErrorKind::SHADOW_SETUP_ERROR; break;
            default: break;
        }
        finish_failed(run, stage, kind, e.what());
    }

    if (run.state == RunState::COMMITTED) {
        spdlog::info("✅ [{}] Committed {} (+{} -{} lines), backup {} retained", run.run_id,
                     proposal.relative_path, run.diff.added, run.diff.removed, run.backup->id);
        if (options.confirm_restart) {
            RestartOutcome restart = request_restart(true);
            if (restart.accepted) {
                advance(run, RunState::RESTART_REQUESTED, restart.message, stage_start);
            } else {
                run.diagnostic = "Committed; restart not scheduled: " + restart.message;
            }
        }
    }

    pin.reset();
    lease.reset();
    audit_->record(run);
    return run;
}

std::vector<BackupRecord> ChangeOrchestrator::list_backups(RootKind root, const std::string& relative_path) const {
    return journal_->list(root, relative_path);
}

RestoreResult ChangeOrchestrator::restore_backup(const std::string& record_id) {
    auto record = journal_->find(record_id);
    if (!record) return {false, "Unknown backup record: " + record_id};

    std::string reason;
    if (!try_acquire_root(record->root, reason)) {
        return {false, std::string(to_string(ErrorKind::RUN_IN_PROGRESS)) + ": " + reason};
    }
    RootLease lease(this, record->root);

    spdlog::warn("⏪ Manual restore of {} from {}", record->relative_path, record->id);
    return journal_->restore(*record);
}

RestartOutcome ChangeOrchestrator::request_restart(bool confirm) {
    if (!supervisor_) {
        if (!confirm) return {false, "Restart not confirmed; nothing done"};
        return {false, "No restart supervisor configured"};
    }
    return supervisor_->request_restart(confirm);
}

size_t ChangeOrchestrator::evict_backups() {
    return journal_->evict();
}

}
