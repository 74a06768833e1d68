#include "shadow/ShadowInstanceManager.hpp"
#include "utils/FileIO.hpp"
#include "utils/Scrubber.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <fnmatch.h>
#include <spdlog/spdlog.h>

namespace autopatch {

namespace fs = std::filesystem;

ShadowInstanceManager::ShadowInstanceManager(ShadowSettings settings,
                                             std::shared_ptr<const SandboxResolver> resolver)
    : settings_(std::move(settings)), resolver_(std::move(resolver)) {
    fs::create_directories(settings_.shadow_root);
    settings_.shadow_root = fs::canonical(settings_.shadow_root);
    for (auto& dir : settings_.excluded_dirs) {
        std::error_code ec;
        auto canonical = fs::weakly_canonical(dir, ec);
        if (!ec) dir = canonical;
    }
    spdlog::info("🪞 Shadow instances under {} (retain on failure: {})",
                 settings_.shadow_root.string(), settings_.retain_on_failure);
}

bool ShadowInstanceManager::is_ignored(const fs::path& name) const {
    std::string n = name.string();
    for (const auto& pattern : settings_.ignore_patterns) {
        if (::fnmatch(pattern.c_str(), n.c_str(), 0) == 0) return true;
    }
    return false;
}

void ShadowInstanceManager::copy_link(const fs::path& src, const fs::path& dst,
                                      const fs::path& base, const fs::path& tree) {
    fs::path target = fs::read_symlink(src);
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(target.is_absolute() ? target : src.parent_path() / target, ec);
    if (ec || !SandboxResolver::is_inside(resolved, base)) {
        spdlog::warn("🔗 Link {} -> {} leaves the root, not copied", src.string(), target.string());
        return;
    }
    // Re-pointed at the same place in the copy.
    if (target.is_relative()) {
        fs::create_symlink(resolved.lexically_relative(src.parent_path()), dst);
    } else {
        fs::create_symlink(tree / resolved.lexically_relative(base), dst);
    }
}

void ShadowInstanceManager::copy_tree(const fs::path& from, const fs::path& to,
                                      const fs::path& base, const fs::path& tree,
                                      const CancellationToken& cancel) {
    fs::create_directory(to);
    for (const auto& entry : fs::directory_iterator(from)) {
        if (cancel.is_cancelled()) {
            throw PipelineError(ErrorKind::CANCELLED, "Cancelled while materializing shadow instance");
        }
        const fs::path& src = entry.path();
        if (is_ignored(src.filename())) continue;
        // Never copy the shadow store into itself.
        if (src == settings_.shadow_root) continue;
        if (std::find(settings_.excluded_dirs.begin(), settings_.excluded_dirs.end(), src) !=
            settings_.excluded_dirs.end()) {
            continue;
        }

        fs::path dst = to / src.filename();
        auto st = entry.symlink_status();
        if (fs::is_symlink(st)) {
            copy_link(src, dst, base, tree);
        } else if (fs::is_directory(st)) {
            copy_tree(src, dst, base, tree, cancel);
        } else if (fs::is_regular_file(st)) {
            fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
        }
        // Sockets, fifos and device nodes are not part of a source tree.
    }
}

ShadowInstance ShadowInstanceManager::materialize(const SandboxRoot& base_root, const CancellationToken& cancel) {
    std::ostringstream id;
    id << "shadow-" << utc_stamp() << "-" << std::setw(4) << std::setfill('0') << sequence_++;

    ShadowInstance inst;
    inst.id = id.str();
    inst.instance_dir = settings_.shadow_root / inst.id;
    inst.tree = inst.instance_dir / "tree";
    inst.created_at_ms = now_ms();
    inst.retain_on_failure = settings_.retain_on_failure;
    inst.status = "materialized";

    {
        std::lock_guard<std::mutex> lock(mtx_);
        instances_[inst.id] = inst;
        in_use_.insert(inst.id);
    }

    auto start = std::chrono::steady_clock::now();
    try {
        if (fs::exists(inst.instance_dir)) {
            spdlog::warn("⚠️ Shadow directory {} already exists, removing", inst.instance_dir.string());
            fs::remove_all(inst.instance_dir);
        }
        fs::create_directories(inst.instance_dir);
        fs::path base = fs::canonical(base_root.path);
        fs::path tree = fs::weakly_canonical(inst.tree);
        copy_tree(base, inst.tree, base, tree, cancel);
        inst.tree = fs::canonical(inst.tree);
    } catch (const PipelineError&) {
        remove_instance_dir(inst.instance_dir);
        std::lock_guard<std::mutex> lock(mtx_);
        instances_.erase(inst.id);
        in_use_.erase(inst.id);
        throw;
    } catch (const std::exception& e) {
        remove_instance_dir(inst.instance_dir);
        {
            std::lock_guard<std::mutex> lock(mtx_);
            instances_.erase(inst.id);
            in_use_.erase(inst.id);
        }
        spdlog::error("💥 Shadow setup failed: {}", e.what());
        throw PipelineError(ErrorKind::SHADOW_SETUP_ERROR, std::string("Shadow copy failed: ") + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(mtx_);
        instances_[inst.id].tree = inst.tree;
    }
    materialized_++;

    double ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    spdlog::info("🪞 Shadow {} materialized from {} in {:.2f} ms", inst.id, base_root.path.string(), ms);
    return inst;
}

void ShadowInstanceManager::apply(const ShadowInstance& instance, RootKind kind,
                                  const std::string& relative_path, const std::string& content) {
    SandboxRoot shadow{kind, instance.tree};
    // Links in the copy point inside the copy; the resolver still rejects
    // anything that would reach another directory.
    fs::path target;
    try {
        target = resolver_->resolve(shadow, relative_path);
    } catch (const PipelineError& e) {
        throw PipelineError(ErrorKind::SHADOW_SETUP_ERROR, std::string("Cannot apply change in shadow: ") + e.what());
    }

    try {
        fs::create_directories(target.parent_path());
        write_file_atomic(target, content);
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::SHADOW_SETUP_ERROR, std::string("Cannot apply change in shadow: ") + e.what());
    }
    spdlog::debug("✍️ Applied {} bytes to shadow {} at {}", content.size(), instance.id, target.string());
}

ShadowReport ShadowInstanceManager::run_shadow(const SandboxRoot& base_root,
                                               const ChangeProposal& proposal,
                                               IVerificationSuite& suite,
                                               const CancellationToken& cancel,
                                               std::optional<bool> retain_on_failure) {
    ShadowInstance inst = materialize(base_root, cancel);
    bool retain = retain_on_failure.value_or(settings_.retain_on_failure);

    try {
        apply(inst, base_root.kind, proposal.relative_path, proposal.content);
    } catch (const PipelineError&) {
        destroy(inst.id);
        throw;
    }

    set_status(inst.id, "testing");
    ShadowReport report;
    report.instance_id = inst.id;

    spdlog::info("🧪 Running '{}' against shadow {}", suite.name(), inst.id);
    try {
        VerificationOutcome outcome = suite.run(inst.tree, cancel);
        report.passed = outcome.passed;
        report.timed_out = outcome.timed_out;
        report.report = outcome.report;
    } catch (const std::exception& e) {
        // A crashing suite is a failing suite.
        report.passed = false;
        report.report = std::string("Verification suite crashed: ") + e.what();
    } catch (...) {
        report.passed = false;
        report.report = "Verification suite crashed with a non-standard exception";
    }
    if (cancel.is_cancelled() && report.passed) {
        report.passed = false;
        report.report = "Cancelled during verification\n" + report.report;
    }
    report.report = scrub_report(report.report);

    if (report.passed || !retain) {
        destroy(inst.id);
    } else {
        report.retained = true;
        set_status(inst.id, "retained");
        std::lock_guard<std::mutex> lock(mtx_);
        in_use_.erase(inst.id);
        spdlog::warn("🔍 Shadow {} retained for inspection at {}", inst.id, inst.instance_dir.string());
    }

    spdlog::info("{} Shadow verdict for {}: {}", report.passed ? "✅" : "❌",
                 proposal.relative_path, report.passed ? "PASS" : "FAIL");
    return report;
}

void ShadowInstanceManager::set_status(const std::string& id, const std::string& status) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = instances_.find(id);
    if (it != instances_.end()) it->second.status = status;
}

void ShadowInstanceManager::remove_instance_dir(const fs::path& dir) {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) spdlog::warn("⚠️ Could not remove shadow directory {}: {}", dir.string(), ec.message());
}

bool ShadowInstanceManager::destroy(const std::string& instance_id) {
    fs::path dir;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = instances_.find(instance_id);
        if (it == instances_.end()) return false;
        dir = it->second.instance_dir;
        instances_.erase(it);
        in_use_.erase(instance_id);
    }
    remove_instance_dir(dir);
    spdlog::debug("🗑️ Shadow {} destroyed", instance_id);
    return true;
}

size_t ShadowInstanceManager::sweep() {
    std::vector<std::string> doomed;
    std::set<std::string> busy;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        busy = in_use_;
        for (const auto& [id, inst] : instances_) {
            if (!in_use_.count(id)) doomed.push_back(id);
        }
    }

    size_t removed = 0;
    for (const auto& id : doomed) {
        if (destroy(id)) removed++;
    }

    // Leftovers from an earlier process are not in the registry.
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(settings_.shadow_root, ec)) {
        std::string name = entry.path().filename().string();
        if (name.rfind("shadow-", 0) != 0 || busy.count(name)) continue;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (instances_.count(name)) continue;
        }
        remove_instance_dir(entry.path());
        removed++;
    }

    spdlog::info("🧹 Shadow sweep removed {} instance(s)", removed);
    return removed;
}

std::vector<ShadowInstance> ShadowInstanceManager::list_instances() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ShadowInstance> out;
    for (const auto& [id, inst] : instances_) out.push_back(inst);
    return out;
}

}
