#pragma once
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <filesystem>
#include "pipeline/ChangeTypes.hpp"
#include "tools/SandboxResolver.hpp"

namespace autopatch {

namespace fs = std::filesystem;

struct RetentionPolicy {
    size_t max_records = 50;          // per store; 0 disables count-based eviction
    long long max_age_seconds = 0;    // 0 disables age-based eviction
};

struct RestoreResult {
    bool success;
    std::string message;
};

// Timestamp-keyed backup store kept outside the source and workspace trees:
//   <backup_root>/index.json          record index
//   <backup_root>/objects/<id>.bak    original bytes
//   <backup_root>/objects/<id>.json   the record itself, used to rebuild a lost index
// Snapshot, restore and evict are serialized on one mutex, so eviction never
// races with a restore.
class BackupJournal {
public:
    BackupJournal(const fs::path& backup_root,
                  std::shared_ptr<const SandboxResolver> resolver,
                  SandboxRoots roots,
                  RetentionPolicy policy = {});

    // 🛡️ Captures the current bytes of root/relative_path. A missing file
    // yields a create-record whose restore deletes the path.
    // Throws PipelineError(BACKUP_IO_ERROR) or (OUT_OF_BOUNDS_PATH).
    BackupRecord snapshot(const SandboxRoot& root, const std::string& relative_path);

    // 🔄 Idempotent: restoring the same record twice gives the same end state.
    RestoreResult restore(const BackupRecord& record);
    RestoreResult restore(const std::string& record_id);

    // Removes records beyond the retention policy, oldest first, skipping
    // pinned records. Returns the number of records removed.
    size_t evict();

    // Newest first. An empty filter lists every record of the root.
    std::vector<BackupRecord> list(RootKind root, const std::string& relative_path = "") const;
    std::optional<BackupRecord> find(const std::string& record_id) const;
    size_t size() const;

    void pin(const std::string& record_id);
    void unpin(const std::string& record_id);
    bool is_pinned(const std::string& record_id) const;

    const fs::path& root_dir() const { return backup_root_; }
    const RetentionPolicy& policy() const { return policy_; }

private:
    fs::path backup_root_;
    fs::path objects_dir_;
    fs::path index_path_;
    std::shared_ptr<const SandboxResolver> resolver_;
    SandboxRoots roots_;
    RetentionPolicy policy_;

    mutable std::mutex mtx_;
    std::vector<BackupRecord> records_;
    std::multiset<std::string> pinned_;
    std::atomic<unsigned long long> sequence_{0};

    RestoreResult restore_locked(const BackupRecord& record);
    void load_index();
    void rebuild_from_objects();
    void save_index_locked();
    fs::path sidecar_path(const std::string& record_id) const { return objects_dir_ / (record_id + ".json"); }
    std::string make_record_id(const std::string& relative_path);
};

// Keeps a record out of eviction for the lifetime of an orchestration run.
class BackupPin {
public:
    BackupPin() = default;
    BackupPin(BackupJournal* journal, std::string record_id)
        : journal_(journal), id_(std::move(record_id)) {
        if (journal_) journal_->pin(id_);
    }
    ~BackupPin() { release(); }

    BackupPin(const BackupPin&) = delete;
    BackupPin& operator=(const BackupPin&) = delete;

    BackupPin(BackupPin&& other) noexcept : journal_(other.journal_), id_(std::move(other.id_)) {
        other.journal_ = nullptr;
    }
    BackupPin& operator=(BackupPin&& other) noexcept {
        if (this != &other) {
            release();
            journal_ = other.journal_;
            id_ = std::move(other.id_);
            other.journal_ = nullptr;
        }
        return *this;
    }

    void release() {
        if (journal_) {
            journal_->unpin(id_);
            journal_ = nullptr;
        }
    }

private:
    BackupJournal* journal_ = nullptr;
    std::string id_;
};

}
