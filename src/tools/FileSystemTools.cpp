#include "tools/FileSystemTools.hpp"
#include "utils/FileIO.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace autopatch {

FileSystemTools::FileSystemTools(std::shared_ptr<const SandboxResolver> resolver, SandboxRoots roots)
    : resolver_(std::move(resolver)), roots_(std::move(roots)) {}

void FileSystemTools::require(ActorRole role, Capability cap, RootKind root) const {
    GuardResult g = AccessPolicy::check_capability(role, cap, root);
    if (!g.allowed) {
        spdlog::warn("🛑 ACCESS DENIED: {}", g.reason);
        throw PipelineError(ErrorKind::ACCESS_DENIED, g.reason);
    }
}

std::string FileSystemTools::read_file(ActorRole role, RootKind root, const std::string& path) const {
    require(role, Capability::READ, root);
    fs::path target = resolver_->resolve(roots_.get(root), path);

    std::error_code ec;
    if (!fs::is_regular_file(target, ec)) {
        throw std::runtime_error("File not found: " + path);
    }
    auto size = fs::file_size(target, ec);
    if (ec) throw std::runtime_error("Cannot stat " + path + ": " + ec.message());
    if (size > kMaxReadBytes) {
        throw std::runtime_error("File too large (>512KB): " + path);
    }
    return read_file_bytes(target);
}

void FileSystemTools::write_file(ActorRole role, RootKind root, const std::string& path,
                                 const std::string& content) const {
    require(role, Capability::WRITE, root);
    if (root == RootKind::SOURCE) {
        throw PipelineError(ErrorKind::ACCESS_DENIED,
                            "BLOCKED: direct writes to the source root are not allowed; use propose_change");
    }
    fs::path target = resolver_->resolve(roots_.get(root), path);
    if (fs::is_directory(target)) {
        throw std::runtime_error("Target is a directory: " + path);
    }
    fs::create_directories(target.parent_path());
    write_file_atomic(target, content);
    spdlog::info("📝 Wrote {} bytes to {}", content.size(), target.string());
}

std::vector<DirEntry> FileSystemTools::list_files(ActorRole role, RootKind root, const std::string& dir) const {
    require(role, Capability::LIST, root);
    const SandboxRoot& base = roots_.get(root);
    std::string input = (dir.empty() || dir == "/") ? "." : dir;
    fs::path target = resolver_->resolve(base, input);

    std::error_code ec;
    if (!fs::is_directory(target, ec)) {
        throw std::runtime_error("Not a directory: " + input);
    }

    std::vector<DirEntry> entries;
    for (const auto& entry : fs::directory_iterator(target, fs::directory_options::skip_permission_denied)) {
        DirEntry e;
        e.relative_path = fs::path(SandboxResolver::relative_to(base, entry.path())).generic_string();
        e.is_directory = entry.is_directory(ec);
        if (!e.is_directory && entry.is_regular_file(ec)) {
            e.size = entry.file_size(ec);
            if (ec) e.size = 0;
        }
        entries.push_back(std::move(e));
    }
    std::sort(entries.begin(), entries.end(),
              [](const DirEntry& a, const DirEntry& b) { return a.relative_path < b.relative_path; });
    return entries;
}

bool FileSystemTools::file_exists(ActorRole role, RootKind root, const std::string& path) const {
    require(role, Capability::EXISTS, root);
    fs::path target = resolver_->resolve(roots_.get(root), path);
    std::error_code ec;
    return fs::exists(target, ec);
}

std::string FileSystemTools::format_listing(const std::string& dir, const std::vector<DirEntry>& entries) {
    std::stringstream ss;
    if (entries.empty()) {
        ss << "Directory '" << dir << "' is empty\n";
        return ss.str();
    }
    ss << "📂 " << dir << "\n";
    for (const auto& e : entries) {
        if (e.is_directory) {
            ss << "  [dir] " << e.relative_path << "\n";
        } else {
            ss << "  [file] " << e.relative_path << " (" << e.size << " bytes)\n";
        }
    }
    return ss.str();
}

namespace {

struct ToolArgs {
    ActorRole role = ActorRole::RESTRICTED_TOOL;
    RootKind root = RootKind::WORKSPACE;
    nlohmann::json json;
};

// Callers that omit role/root get the least privileged combination.
ToolArgs parse_args(const std::string& args_json) {
    ToolArgs a;
    a.json = nlohmann::json::parse(args_json);
    if (a.json.contains("role")) {
        auto r = parse_role(a.json.value("role", ""));
        if (!r) throw std::invalid_argument("unknown role '" + a.json.value("role", "") + "'");
        a.role = *r;
    }
    if (a.json.contains("root")) {
        auto r = parse_root(a.json.value("root", ""));
        if (!r) throw std::invalid_argument("unknown root '" + a.json.value("root", "") + "'");
        a.root = *r;
    }
    return a;
}

template <typename Fn>
std::string guarded(const std::string& tool, Fn&& fn) {
    try {
        return fn();
    } catch (const PipelineError& e) {
        return std::string("ERROR: ") + to_string(e.kind()) + ": " + e.what();
    } catch (const nlohmann::json::exception& e) {
        return std::string("ERROR: Invalid JSON: ") + e.what();
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ [{}] {}", tool, e.what());
        return std::string("ERROR: ") + e.what();
    }
}

}

std::string ReadFileTool::execute(const std::string& args_json) {
    return guarded("read_file", [&] {
        auto a = parse_args(args_json);
        return fs_->read_file(a.role, a.root, a.json.at("path").get<std::string>());
    });
}

std::string WriteFileTool::execute(const std::string& args_json) {
    return guarded("write_file", [&] {
        auto a = parse_args(args_json);
        std::string path = a.json.at("path").get<std::string>();
        std::string content = a.json.at("content").get<std::string>();
        fs_->write_file(a.role, a.root, path, content);
        return "Wrote " + std::to_string(content.size()) + " bytes to " + path;
    });
}

std::string ListDirTool::execute(const std::string& args_json) {
    return guarded("list_files", [&] {
        auto a = parse_args(args_json);
        std::string dir = a.json.value("path", ".");
        return FileSystemTools::format_listing(dir, fs_->list_files(a.role, a.root, dir));
    });
}

std::string FileExistsTool::execute(const std::string& args_json) {
    return guarded("file_exists", [&] {
        auto a = parse_args(args_json);
        return std::string(fs_->file_exists(a.role, a.root, a.json.at("path").get<std::string>()) ? "true" : "false");
    });
}

void register_file_tools(ToolRegistry& registry, std::shared_ptr<FileSystemTools> tools) {
    registry.register_tool(std::make_unique<ReadFileTool>(tools));
    registry.register_tool(std::make_unique<WriteFileTool>(tools));
    registry.register_tool(std::make_unique<ListDirTool>(tools));
    registry.register_tool(std::make_unique<FileExistsTool>(tools));
}

}
