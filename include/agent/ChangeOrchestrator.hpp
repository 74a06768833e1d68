#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "pipeline/AuditLog.hpp"
#include "pipeline/ChangeTypes.hpp"
#include "agent/RestartSupervisor.hpp"
#include "shadow/ShadowInstanceManager.hpp"
#include "shadow/VerificationSuite.hpp"
#include "syntax_validator.hpp"
#include "tools/BackupJournal.hpp"
#include "tools/SandboxResolver.hpp"
#include "utils/CancellationToken.hpp"

namespace autopatch {

// Performs the real-tree write of a Committed transition.
class IFileWriter {
public:
    virtual ~IFileWriter() = default;
    // Throws on failure. May leave `target` partially written.
    virtual void write(const fs::path& target, const std::string& content) = 0;
};

// Temp file + fsync + rename. Re-running it with the same content is safe.
class AtomicFileWriter : public IFileWriter {
public:
    void write(const fs::path& target, const std::string& content) override;
};

struct ProposeOptions {
    bool confirm_restart = false;
    CancellationToken cancel;
    std::string language_hint;                      // empty: from the file extension
    std::optional<bool> retain_shadow_on_failure;   // overrides ShadowSettings
};

struct OrchestratorSettings {
    // 0 rejects a busy root with RunInProgress; >0 queues for at most this long.
    int busy_wait_ms = 0;
};

// Sequences propose -> access check -> resolve -> validate -> backup ->
// shadow test -> commit or rollback -> optional restart. At most one run is
// in flight per root; the real tree is only written by a Committed transition.
class ChangeOrchestrator {
public:
    ChangeOrchestrator(SandboxRoots roots,
                       std::shared_ptr<const SandboxResolver> resolver,
                       std::shared_ptr<BackupJournal> journal,
                       std::shared_ptr<ShadowInstanceManager> shadows,
                       std::shared_ptr<IVerificationSuite> suite,
                       std::shared_ptr<AuditLog> audit,
                       OrchestratorSettings settings = {},
                       std::shared_ptr<IFileWriter> writer = nullptr);

    void set_restart_supervisor(std::shared_ptr<RestartSupervisor> supervisor);

    OrchestrationRun propose_change(ActorRole role, RootKind root,
                                    const std::string& relative_path,
                                    const std::string& content,
                                    const std::string& rationale,
                                    const ProposeOptions& options = {});
    OrchestrationRun propose_change(const ChangeProposal& proposal, const ProposeOptions& options = {});

    std::vector<BackupRecord> list_backups(RootKind root, const std::string& relative_path = "") const;

    // Manual rollback outside the automatic pipeline. Takes the root's run
    // slot, so it never interleaves with a run on the same root.
    RestoreResult restore_backup(const std::string& record_id);

    RestartOutcome request_restart(bool confirm);

    size_t evict_backups();

    // Refuses new runs and waits for in-flight ones. Returns false when runs
    // were still active after `timeout`.
    bool begin_drain(std::chrono::milliseconds timeout = std::chrono::seconds(30));
    void end_drain();
    bool draining() const { return draining_.load(); }
    size_t in_flight() const;

    const SandboxRoots& roots() const { return roots_; }
    std::shared_ptr<AuditLog> audit() const { return audit_; }

private:
    // Holds the single run slot of one root.
    class RootLease {
    public:
        RootLease(ChangeOrchestrator* owner, RootKind root) : owner_(owner), root_(root) {}
        ~RootLease() { if (owner_) owner_->release_root(root_); }
        RootLease(const RootLease&) = delete;
        RootLease& operator=(const RootLease&) = delete;
        RootLease(RootLease&& other) noexcept : owner_(other.owner_), root_(other.root_) { other.owner_ = nullptr; }
        RootLease& operator=(RootLease&&) = delete;

    private:
        ChangeOrchestrator* owner_;
        RootKind root_;
    };

    SandboxRoots roots_;
    std::shared_ptr<const SandboxResolver> resolver_;
    std::shared_ptr<BackupJournal> journal_;
    std::shared_ptr<ShadowInstanceManager> shadows_;
    std::shared_ptr<IVerificationSuite> suite_;
    std::shared_ptr<AuditLog> audit_;
    OrchestratorSettings settings_;
    std::shared_ptr<IFileWriter> writer_;
    std::shared_ptr<RestartSupervisor> supervisor_;

    syntax::SyntaxValidator validator_;
    std::mutex validator_mtx_;

    mutable std::mutex lease_mtx_;
    std::condition_variable lease_cv_;
    std::set<RootKind> busy_roots_;
    std::atomic<bool> draining_{false};
    std::atomic<unsigned long long> run_seq_{0};

    // Marks `root` busy; the caller wraps success in a RootLease.
    bool try_acquire_root(RootKind root, std::string& reason);
    void release_root(RootKind root);

    void commit(OrchestrationRun& run, const BackupRecord& backup);
    void advance(OrchestrationRun& run, RunState next, const std::string& detail,
                 std::chrono::steady_clock::time_point& stage_start);
    void finish_failed(OrchestrationRun& run, RunState stage, ErrorKind kind, const std::string& diagnostic);
};

}
