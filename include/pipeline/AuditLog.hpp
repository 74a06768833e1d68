#pragma once
#include <deque>
#include <mutex>
#include <string>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "pipeline/ChangeTypes.hpp"
#include "utils/FileIO.hpp"

namespace autopatch {

using json = nlohmann::json;

// Bounded trail of finished orchestration runs, persisted as a JSON array.
// An empty path keeps the trail in memory only.
class AuditLog {
public:
    explicit AuditLog(std::filesystem::path path = {}, size_t capacity = 200)
        : path_(std::move(path)), capacity_(capacity) {
        load_from_disk();
    }

    void record(const OrchestrationRun& run) {
        std::lock_guard<std::mutex> lock(mtx_);
        entries_.push_back(run.to_json());
        while (entries_.size() > capacity_) entries_.pop_front();
        save_to_disk();
    }

    // Newest first.
    json recent_runs(size_t limit = 50) const {
        std::lock_guard<std::mutex> lock(mtx_);
        json out = json::array();
        for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < limit; ++it) {
            out.push_back(*it);
        }
        return out;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return entries_.size();
    }

private:
    std::filesystem::path path_;
    size_t capacity_;
    std::deque<json> entries_;
    mutable std::mutex mtx_;

    void save_to_disk() {
        if (path_.empty()) return;
        json j = json::array();
        for (const auto& e : entries_) j.push_back(e);
        try {
            std::string text = dump_lenient(j, 2);
            if (path_.has_parent_path()) std::filesystem::create_directories(path_.parent_path());
            write_file_atomic(path_, text);
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Cannot write audit log {}: {}", path_.string(), e.what());
        }
    }

    void load_from_disk() {
        if (path_.empty() || !std::filesystem::exists(path_)) return;
        try {
            std::ifstream i(path_);
            json j;
            i >> j;
            for (const auto& item : j) entries_.push_back(item);
            while (entries_.size() > capacity_) entries_.pop_front();
            spdlog::info("📜 Loaded {} audit entries from {}", entries_.size(), path_.string());
        } catch (const json::exception& e) {
            spdlog::error("❌ Failed to load audit log {}: {}. Starting fresh.", path_.string(), e.what());
            entries_.clear();
        }
    }
};

}
