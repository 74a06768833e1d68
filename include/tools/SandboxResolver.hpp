#pragma once
#include <atomic>
#include <string>
#include <filesystem>
#include "pipeline/ChangeTypes.hpp"

namespace autopatch {

namespace fs = std::filesystem;

// Confines caller-supplied paths to a SandboxRoot. Every read or write in the
// pipeline goes through resolve() right before it touches the disk; resolved
// paths are never cached across suspension points.
class SandboxResolver {
public:
    // Canonicalizes (and optionally creates) a root directory at startup.
    static SandboxRoot make_root(RootKind kind, const fs::path& dir, bool create = true);

    // Returns the canonical absolute path of `input` inside `root`.
    // Throws PipelineError(OUT_OF_BOUNDS_PATH) for empty input, escapes via
    // "..", absolute paths or symlinks, device files and unresolvable paths.
    fs::path resolve(const SandboxRoot& root, const std::string& input) const;

    // Segment-wise ancestry check on already canonical paths.
    static bool is_inside(const fs::path& child, const fs::path& parent);

    static std::string relative_to(const SandboxRoot& root, const fs::path& resolved);

    // Number of resolve() calls made so far; each one touches the filesystem.
    size_t resolution_count() const { return resolutions_.load(); }

private:
    mutable std::atomic<size_t> resolutions_{0};
};

// The two configured roots. Built once at process start.
struct SandboxRoots {
    SandboxRoot source;
    SandboxRoot workspace;

    const SandboxRoot& get(RootKind kind) const {
        return kind == RootKind::SOURCE ? source : workspace;
    }
};

}
