#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <filesystem>
#include "pipeline/ChangeTypes.hpp"
#include "tools/SandboxResolver.hpp"
#include "shadow/VerificationSuite.hpp"
#include "utils/CancellationToken.hpp"

namespace autopatch {

namespace fs = std::filesystem;

struct ShadowSettings {
    fs::path shadow_root;
    bool retain_on_failure = false;
    std::vector<std::string> ignore_patterns = {
        ".git", "__pycache__", "*.pyc", ".pytest_cache", "*.egg-info", ".venv", "venv", "build"
    };
    // Absolute directories never copied, e.g. a backup store under the source root.
    std::vector<fs::path> excluded_dirs;
};

struct ShadowInstance {
    std::string id;
    fs::path instance_dir;      // <shadow_root>/<id>
    fs::path tree;              // <instance_dir>/tree, the isolated copy
    long long created_at_ms = 0;
    bool retain_on_failure = false;
    std::string status;         // materialized | testing | passed | failed | retained
};

struct ShadowReport {
    bool passed = false;
    std::string report;
    std::string instance_id;
    bool retained = false;
    bool timed_out = false;
};

// Materializes isolated copies of a root, applies a candidate change inside
// the copy and runs a verification suite against it. Each instance lives in
// its own directory, so concurrent instances never see each other's writes.
class ShadowInstanceManager {
public:
    ShadowInstanceManager(ShadowSettings settings, std::shared_ptr<const SandboxResolver> resolver);

    // Throws PipelineError(SHADOW_SETUP_ERROR) when the copy or the apply step
    // fails and PipelineError(CANCELLED) when cancelled during setup. Suite
    // crashes and timeouts are reported as a failed ShadowReport.
    ShadowReport run_shadow(const SandboxRoot& base_root,
                            const ChangeProposal& proposal,
                            IVerificationSuite& suite,
                            const CancellationToken& cancel,
                            std::optional<bool> retain_on_failure = std::nullopt);

    ShadowInstance materialize(const SandboxRoot& base_root, const CancellationToken& cancel);
    void apply(const ShadowInstance& instance, RootKind kind,
               const std::string& relative_path, const std::string& content);

    bool destroy(const std::string& instance_id);

    // Explicit cleanup of retained instances and of directories orphaned
    // under the shadow root by an earlier process. Skips instances in use.
    size_t sweep();

    std::vector<ShadowInstance> list_instances() const;
    size_t materialized_count() const { return materialized_.load(); }
    const ShadowSettings& settings() const { return settings_; }

private:
    ShadowSettings settings_;
    std::shared_ptr<const SandboxResolver> resolver_;

    mutable std::mutex mtx_;
    std::map<std::string, ShadowInstance> instances_;
    std::set<std::string> in_use_;
    std::atomic<unsigned long long> sequence_{0};
    std::atomic<size_t> materialized_{0};

    bool is_ignored(const fs::path& name) const;
    void copy_tree(const fs::path& from, const fs::path& to,
                   const fs::path& base, const fs::path& tree,
                   const CancellationToken& cancel);
    void copy_link(const fs::path& src, const fs::path& dst,
                   const fs::path& base, const fs::path& tree);
    void set_status(const std::string& id, const std::string& status);
    void remove_instance_dir(const fs::path& dir);
};

}
