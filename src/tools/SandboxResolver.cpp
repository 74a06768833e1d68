#include "tools/SandboxResolver.hpp"
#include <spdlog/spdlog.h>

namespace autopatch {

namespace fs = std::filesystem;

SandboxRoot SandboxResolver::make_root(RootKind kind, const fs::path& dir, bool create) {
    if (dir.empty()) {
        throw std::runtime_error(std::string("Sandbox root '") + to_string(kind) + "' is not configured");
    }
    std::error_code ec;
    if (create && !fs::exists(dir, ec)) {
        fs::create_directories(dir, ec);
        if (ec) {
            throw std::runtime_error("Cannot create sandbox root " + dir.string() + ": " + ec.message());
        }
    }
    fs::path canonical = fs::canonical(dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot canonicalize sandbox root " + dir.string() + ": " + ec.message());
    }
    if (!fs::is_directory(canonical)) {
        throw std::runtime_error("Sandbox root is not a directory: " + canonical.string());
    }
    spdlog::info("🧱 Sandbox root [{}] -> {}", to_string(kind), canonical.string());
    return SandboxRoot{kind, canonical};
}

// Segment-wise comparison: "/srv/app" must not contain "/srv/app-evil".
bool SandboxResolver::is_inside(const fs::path& child, const fs::path& parent) {
    if (parent.empty() || child.empty()) return false;
    auto it_c = child.begin();
    for (auto it_p = parent.begin(); it_p != parent.end(); ++it_p) {
        // A trailing separator yields an empty final element.
        if (it_p->empty()) continue;
        if (it_c == child.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

std::string SandboxResolver::relative_to(const SandboxRoot& root, const fs::path& resolved) {
    return resolved.lexically_relative(root.path).generic_string();
}

fs::path SandboxResolver::resolve(const SandboxRoot& root, const std::string& input) const {
    resolutions_++;

    if (input.empty()) {
        throw PipelineError(ErrorKind::OUT_OF_BOUNDS_PATH, "Empty path");
    }
    if (input.find('\0') != std::string::npos) {
        throw PipelineError(ErrorKind::OUT_OF_BOUNDS_PATH, "Path contains a NUL byte");
    }

    fs::path requested(input);
    fs::path combined = requested.is_absolute() ? requested : (root.path / requested);

    // Resolves ".", ".." and every symlink on the existing prefix; the
    // non-existing tail is normalized lexically.
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(combined, ec);
    if (ec) {
        spdlog::warn("🚨 Path resolution failed for '{}': {}", input, ec.message());
        throw PipelineError(ErrorKind::OUT_OF_BOUNDS_PATH,
                            "Cannot resolve '" + input + "': " + ec.message());
    }
    canonical = canonical.lexically_normal();

    if (!is_inside(canonical, root.path)) {
        spdlog::warn("🚨 SECURITY ALERT: Path escape blocked! Root: {} | Target: {}",
                     root.path.string(), canonical.string());
        throw PipelineError(ErrorKind::OUT_OF_BOUNDS_PATH,
                            "Path '" + input + "' escapes the " + to_string(root.kind) + " root");
    }

    auto st = fs::status(canonical, ec);
    if (!ec && fs::exists(st) && !fs::is_regular_file(st) && !fs::is_directory(st)) {
        throw PipelineError(ErrorKind::OUT_OF_BOUNDS_PATH,
                            "Path '" + input + "' is not a regular file or directory");
    }

    return canonical;
}

}
