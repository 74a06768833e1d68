#include "tools/ToolRegistry.hpp"
#include <spdlog/spdlog.h>

namespace autopatch {

void ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
    auto meta = tool->get_metadata();
    std::lock_guard<std::mutex> lock(mtx_);
    if (tools_.count(meta.name)) {
        spdlog::warn("⚠️ Tool '{}' registered twice, replacing", meta.name);
    }
    tools_[meta.name] = std::move(tool);
    spdlog::debug("🔧 Registered tool: {}", meta.name);
}

bool ToolRegistry::has_tool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return tools_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::tool_names() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> names;
    for (const auto& [name, tool] : tools_) names.push_back(name);
    return names;
}

std::string ToolRegistry::get_manifest() const {
    std::lock_guard<std::mutex> lock(mtx_);
    nlohmann::json manifest = nlohmann::json::array();
    for (const auto& [name, tool] : tools_) {
        auto meta = tool->get_metadata();
        nlohmann::json schema;
        try {
            schema = nlohmann::json::parse(meta.schema);
        } catch (const nlohmann::json::exception&) {
            schema = meta.schema;
        }
        manifest.push_back({{"name", meta.name}, {"description", meta.description}, {"schema", schema}});
    }
    return manifest.dump(2);
}

std::string ToolRegistry::dispatch(const std::string& name, const nlohmann::json& params) {
    ITool* tool = nullptr;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = tools_.find(name);
        if (it != tools_.end()) tool = it->second.get();
    }
    if (!tool) {
        spdlog::warn("❓ Unknown tool requested: {}", name);
        return "ERROR: Unknown tool '" + name + "'.";
    }
    return tool->execute(params.dump());
}

}
