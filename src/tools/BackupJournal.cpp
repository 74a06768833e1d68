#include "tools/BackupJournal.hpp"
#include "utils/FileIO.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

namespace autopatch {

namespace fs = std::filesystem;

BackupJournal::BackupJournal(const fs::path& backup_root,
                             std::shared_ptr<const SandboxResolver> resolver,
                             SandboxRoots roots,
                             RetentionPolicy policy)
    : backup_root_(backup_root),
      objects_dir_(backup_root / "objects"),
      index_path_(backup_root / "index.json"),
      resolver_(std::move(resolver)),
      roots_(std::move(roots)),
      policy_(policy) {
    fs::create_directories(objects_dir_);
    load_index();
    spdlog::info("🗄️ Backup journal at {} ({} records, keep {} / {}s)",
                 backup_root_.string(), records_.size(), policy_.max_records, policy_.max_age_seconds);
}

std::string BackupJournal::make_record_id(const std::string& relative_path) {
    std::string flat = relative_path;
    std::replace(flat.begin(), flat.end(), '/', '_');
    std::replace(flat.begin(), flat.end(), '\\', '_');
    std::replace(flat.begin(), flat.end(), ':', '_');
    if (flat.size() > 80) flat = flat.substr(flat.size() - 80);

    // Ids from an earlier process can share the millisecond stamp.
    for (;;) {
        std::ostringstream id;
        id << utc_stamp() << "-" << std::setw(6) << std::setfill('0') << sequence_++ << "-" << flat;
        std::error_code ec;
        if (!fs::exists(sidecar_path(id.str()), ec)) return id.str();
    }
}

BackupRecord BackupJournal::snapshot(const SandboxRoot& root, const std::string& relative_path) {
    std::lock_guard<std::mutex> lock(mtx_);

    fs::path target = resolver_->resolve(root, relative_path);

    BackupRecord record;
    record.id = make_record_id(SandboxResolver::relative_to(root, target));
    record.root = root.kind;
    record.relative_path = SandboxResolver::relative_to(root, target);
    record.original_path = target;
    record.created_at_ms = now_ms();

    std::error_code ec;
    bool exists = fs::exists(target, ec);
    if (ec) {
        throw PipelineError(ErrorKind::BACKUP_IO_ERROR, "Cannot stat " + target.string() + ": " + ec.message());
    }
    if (exists && fs::is_directory(target, ec)) {
        throw PipelineError(ErrorKind::BACKUP_IO_ERROR, target.string() + " is a directory");
    }

    record.existed = exists;
    if (exists) {
        record.backup_path = objects_dir_ / (record.id + ".bak");
        try {
            std::string bytes = read_file_bytes(target);
            record.checksum = sha256_hex(bytes);
            record.size = bytes.size();
            write_file_atomic(record.backup_path, bytes);
            if (sha256_hex(read_file_bytes(record.backup_path)) != record.checksum) {
                throw std::runtime_error("backup copy does not match the original");
            }
        } catch (const std::exception& e) {
            fs::remove(record.backup_path, ec);
            spdlog::error("🚨 Journal Backup Failed: {}", e.what());
            throw PipelineError(ErrorKind::BACKUP_IO_ERROR, std::string("Backup failed: ") + e.what());
        }
    }

    try {
        write_file_atomic(sidecar_path(record.id), record.to_json().dump(2));
    } catch (const std::exception& e) {
        if (!record.backup_path.empty()) fs::remove(record.backup_path, ec);
        fs::remove(sidecar_path(record.id), ec);
        spdlog::error("🚨 Journal Backup Failed: {}", e.what());
        throw PipelineError(ErrorKind::BACKUP_IO_ERROR, std::string("Backup record write failed: ") + e.what());
    }

    records_.push_back(record);
    try {
        save_index_locked();
    } catch (const std::exception& e) {
        records_.pop_back();
        if (!record.backup_path.empty()) fs::remove(record.backup_path, ec);
        fs::remove(sidecar_path(record.id), ec);
        spdlog::error("🚨 Journal index write failed: {}", e.what());
        throw PipelineError(ErrorKind::BACKUP_IO_ERROR, std::string("Backup index write failed: ") + e.what());
    }

    spdlog::info("🛡️ Snapshot {} of {} ({})", record.id, record.relative_path,
                 record.existed ? std::to_string(record.size) + " bytes" : "create-record");
    return record;
}

RestoreResult BackupJournal::restore(const BackupRecord& record) {
    std::lock_guard<std::mutex> lock(mtx_);
    return restore_locked(record);
}

RestoreResult BackupJournal::restore(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const BackupRecord& r) { return r.id == record_id; });
    if (it == records_.end()) {
        return {false, "Unknown backup record: " + record_id};
    }
    BackupRecord copy = *it;
    return restore_locked(copy);
}

RestoreResult BackupJournal::restore_locked(const BackupRecord& record) {
    fs::path target;
    try {
        target = resolver_->resolve(roots_.get(record.root), record.relative_path);
    } catch (const PipelineError& e) {
        spdlog::critical("💥 ROLLBACK FAILED: {}", e.what());
        return {false, e.what()};
    }

    std::error_code ec;
    if (!record.existed) {
        if (fs::exists(target, ec)) {
            fs::remove(target, ec);
            if (ec) {
                spdlog::critical("💥 ROLLBACK FAILED: cannot remove {}: {}", target.string(), ec.message());
                return {false, "Cannot remove " + target.string() + ": " + ec.message()};
            }
        }
        spdlog::warn("🔄 Rollback removed created file: {}", target.string());
        return {true, "Removed " + record.relative_path + " (did not exist before)"};
    }

    try {
        std::string bytes = read_file_bytes(record.backup_path);
        if (sha256_hex(bytes) != record.checksum) {
            spdlog::critical("💥 ROLLBACK FAILED: backup object {} is corrupt", record.backup_path.string());
            return {false, "Backup object checksum mismatch for " + record.id};
        }
        fs::create_directories(target.parent_path());
        write_file_atomic(target, bytes);
    } catch (const std::exception& e) {
        spdlog::critical("💥 ROLLBACK FAILED: {}. Manual repair required!", e.what());
        return {false, e.what()};
    }

    spdlog::warn("🔄 Rollback restored {} from {}", target.string(), record.id);
    return {true, "Restored " + record.relative_path + " from " + record.id};
}

size_t BackupJournal::evict() {
    std::lock_guard<std::mutex> lock(mtx_);

    std::vector<BackupRecord> ordered = records_;
    std::sort(ordered.begin(), ordered.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
        return a.id < b.id;
    });

    long long cutoff = policy_.max_age_seconds > 0 ? now_ms() - policy_.max_age_seconds * 1000 : 0;
    size_t remaining = ordered.size();
    std::set<std::string> doomed;

    for (const auto& r : ordered) {
        bool over_count = policy_.max_records > 0 && remaining > policy_.max_records;
        bool too_old = policy_.max_age_seconds > 0 && r.created_at_ms < cutoff;
        if (!over_count && !too_old) continue;
        if (pinned_.count(r.id)) continue;
        doomed.insert(r.id);
        remaining--;
    }
    if (doomed.empty()) return 0;

    for (const auto& r : records_) {
        if (!doomed.count(r.id)) continue;
        std::error_code ec;
        if (!r.backup_path.empty()) {
            fs::remove(r.backup_path, ec);
            if (ec) spdlog::warn("⚠️ Could not delete backup object {}: {}", r.backup_path.string(), ec.message());
        }
        fs::remove(sidecar_path(r.id), ec);
    }
    records_.erase(std::remove_if(records_.begin(), records_.end(),
                                  [&](const BackupRecord& r) { return doomed.count(r.id) > 0; }),
                   records_.end());

    try {
        save_index_locked();
    } catch (const std::exception& e) {
        spdlog::error("🚨 Journal index write failed after eviction: {}", e.what());
    }
    spdlog::info("🧹 Evicted {} backup records ({} kept)", doomed.size(), records_.size());
    return doomed.size();
}

std::vector<BackupRecord> BackupJournal::list(RootKind root, const std::string& relative_path) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string filter = relative_path.empty() ? "" : fs::path(relative_path).lexically_normal().generic_string();

    std::vector<BackupRecord> out;
    for (const auto& r : records_) {
        if (r.root != root) continue;
        if (!filter.empty() && r.relative_path != filter) continue;
        out.push_back(r);
    }
    std::sort(out.begin(), out.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
        return a.id > b.id;
    });
    return out;
}

std::optional<BackupRecord> BackupJournal::find(const std::string& record_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& r : records_) {
        if (r.id == record_id) return r;
    }
    return std::nullopt;
}

size_t BackupJournal::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.size();
}

void BackupJournal::pin(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    pinned_.insert(record_id);
}

void BackupJournal::unpin(const std::string& record_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = pinned_.find(record_id);
    if (it != pinned_.end()) pinned_.erase(it);
}

bool BackupJournal::is_pinned(const std::string& record_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return pinned_.count(record_id) > 0;
}

void BackupJournal::load_index() {
    std::error_code ec;
    if (!fs::exists(index_path_, ec)) {
        rebuild_from_objects();
        return;
    }
    try {
        std::ifstream f(index_path_);
        auto j = nlohmann::json::parse(f);
        for (const auto& item : j.value("records", nlohmann::json::array())) {
            records_.push_back(BackupRecord::from_json(item));
        }
    } catch (const std::exception& e) {
        records_.clear();
        fs::path aside = index_path_;
        aside += ".corrupt-" + utc_stamp();
        fs::rename(index_path_, aside, ec);
        spdlog::critical("💥 Backup index {} is unreadable ({}). Set aside as {}, rebuilding from objects.",
                         index_path_.string(), e.what(), ec ? "<rename failed: " + ec.message() + ">" : aside.string());
        rebuild_from_objects();
    }
}

void BackupJournal::rebuild_from_objects() {
    for (const auto& entry : fs::directory_iterator(objects_dir_)) {
        if (entry.path().extension() != ".json") continue;
        try {
            std::ifstream f(entry.path());
            BackupRecord r = BackupRecord::from_json(nlohmann::json::parse(f));
            if (r.existed && !fs::exists(r.backup_path)) {
                spdlog::warn("⚠️ Record {} has no backup object, skipped", r.id);
                continue;
            }
            records_.push_back(std::move(r));
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Unreadable backup record {}: {}", entry.path().string(), e.what());
        }
    }
    if (records_.empty()) return;

    std::sort(records_.begin(), records_.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
        return a.id < b.id;
    });
    try {
        save_index_locked();
    } catch (const std::exception& e) {
        spdlog::error("🚨 Journal index write failed after rebuild: {}", e.what());
    }
    spdlog::warn("🩹 Rebuilt backup index with {} records from {}", records_.size(), objects_dir_.string());
}

void BackupJournal::save_index_locked() {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& r : records_) list.push_back(r.to_json());
    nlohmann::json j = {{"version", 1}, {"records", list}};
    write_file_atomic(index_path_, j.dump(2));
}

}
