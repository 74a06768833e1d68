#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include "pipeline/AccessPolicy.hpp"
#include "pipeline/ChangeTypes.hpp"
#include "tools/SandboxResolver.hpp"
#include "tools/ToolRegistry.hpp"

namespace autopatch {

namespace fs = std::filesystem;

struct DirEntry {
    std::string relative_path;  // relative to the root, generic separators
    bool is_directory = false;
    std::uintmax_t size = 0;    // 0 for directories
};

// The fixed hand-tool capability set. Every call checks the role table first
// and resolves the path only when the capability is granted.
// Access failures throw PipelineError (ACCESS_DENIED / OUT_OF_BOUNDS_PATH);
// missing files and I/O errors throw std::runtime_error.
class FileSystemTools {
public:
    static constexpr std::uintmax_t kMaxReadBytes = 512 * 1024;

    FileSystemTools(std::shared_ptr<const SandboxResolver> resolver, SandboxRoots roots);

    std::string read_file(ActorRole role, RootKind root, const std::string& path) const;

    // Scratch writes only. Source-root changes must go through the orchestrator.
    void write_file(ActorRole role, RootKind root, const std::string& path, const std::string& content) const;

    // One level, sorted by name.
    std::vector<DirEntry> list_files(ActorRole role, RootKind root, const std::string& dir = ".") const;

    bool file_exists(ActorRole role, RootKind root, const std::string& path) const;

    static std::string format_listing(const std::string& dir, const std::vector<DirEntry>& entries);

    const SandboxRoots& roots() const { return roots_; }

private:
    std::shared_ptr<const SandboxResolver> resolver_;
    SandboxRoots roots_;

    void require(ActorRole role, Capability cap, RootKind root) const;
};

// Registers read_file, write_file, list_files and file_exists.
void register_file_tools(ToolRegistry& registry, std::shared_ptr<FileSystemTools> tools);

// Tool Registry Wrappers. Arguments: {"role", "root", "path", ...}
class ReadFileTool : public ITool {
public:
    explicit ReadFileTool(std::shared_ptr<FileSystemTools> fs) : fs_(std::move(fs)) {}
    ToolMetadata get_metadata() override {
        return {"read_file", "Reads file content (max 512 KiB). Input: {'role','root','path'}",
                "{\"type\":\"object\",\"properties\":{\"role\":{\"type\":\"string\"},\"root\":{\"type\":\"string\"},"
                "\"path\":{\"type\":\"string\"}},\"required\":[\"path\"]}"};
    }
    std::string execute(const std::string& args_json) override;
private:
    std::shared_ptr<FileSystemTools> fs_;
};

class WriteFileTool : public ITool {
public:
    explicit WriteFileTool(std::shared_ptr<FileSystemTools> fs) : fs_(std::move(fs)) {}
    ToolMetadata get_metadata() override {
        return {"write_file", "Writes a scratch file in the workspace. Input: {'role','root','path','content'}",
                "{\"type\":\"object\",\"properties\":{\"role\":{\"type\":\"string\"},\"root\":{\"type\":\"string\"},"
                "\"path\":{\"type\":\"string\"},\"content\":{\"type\":\"string\"}},\"required\":[\"path\",\"content\"]}"};
    }
    std::string execute(const std::string& args_json) override;
private:
    std::shared_ptr<FileSystemTools> fs_;
};

class ListDirTool : public ITool {
public:
    explicit ListDirTool(std::shared_ptr<FileSystemTools> fs) : fs_(std::move(fs)) {}
    ToolMetadata get_metadata() override {
        return {"list_files", "Lists a directory. Input: {'role','root','path'}",
                "{\"type\":\"object\",\"properties\":{\"role\":{\"type\":\"string\"},\"root\":{\"type\":\"string\"},"
                "\"path\":{\"type\":\"string\"}}}"};
    }
    std::string execute(const std::string& args_json) override;
private:
    std::shared_ptr<FileSystemTools> fs_;
};

class FileExistsTool : public ITool {
public:
    explicit FileExistsTool(std::shared_ptr<FileSystemTools> fs) : fs_(std::move(fs)) {}
    ToolMetadata get_metadata() override {
        return {"file_exists", "Checks whether a path exists. Input: {'role','root','path'}",
                "{\"type\":\"object\",\"properties\":{\"role\":{\"type\":\"string\"},\"root\":{\"type\":\"string\"},"
                "\"path\":{\"type\":\"string\"}},\"required\":[\"path\"]}"};
    }
    std::string execute(const std::string& args_json) override;
private:
    std::shared_ptr<FileSystemTools> fs_;
};

}
