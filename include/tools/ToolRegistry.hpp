#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace autopatch {

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string schema;     // JSON schema of the arguments object
};

// A JSON-argument tool. Failures come back as strings starting with "ERROR:".
class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    virtual std::string execute(const std::string& args_json) = 0;
};

class GenericTool : public ITool {
public:
    using Fn = std::function<std::string(const std::string&)>;

    GenericTool(std::string name, std::string description, std::string schema, Fn fn)
        : meta_{std::move(name), std::move(description), std::move(schema)}, fn_(std::move(fn)) {}

    ToolMetadata get_metadata() override { return meta_; }
    std::string execute(const std::string& args_json) override { return fn_(args_json); }

private:
    ToolMetadata meta_;
    Fn fn_;
};

class ToolRegistry {
public:
    void register_tool(std::unique_ptr<ITool> tool);

    bool has_tool(const std::string& name) const;
    std::vector<std::string> tool_names() const;

    // JSON array of {name, description, schema}.
    std::string get_manifest() const;

    std::string dispatch(const std::string& name, const nlohmann::json& params);

private:
    mutable std::mutex mtx_;
    std::map<std::string, std::unique_ptr<ITool>> tools_;
};

}
