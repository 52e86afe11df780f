#include "tools/tool_registry.hpp"

#include <exception>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/schema_validator.hpp"

namespace mobilemcp::tools {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using nlohmann::json;

ToolRegistry::ToolRegistry(std::string name_prefix) : name_prefix_(std::move(name_prefix)) {}

core::errors::Result<bool> ToolRegistry::register_tool(ToolDefinition definition) {
    if (definition.name.empty() || !definition.handler) {
        return MobileError{ErrorCategory::Internal, "Tool definition needs a name and a handler.",
                           "invalid_tool_definition"};
    }
    if (index_.count(definition.name) != 0) {
        return MobileError{ErrorCategory::Internal,
                           "Tool registered twice: " + definition.name, "duplicate_tool"};
    }
    index_[definition.name] = tools_.size();
    tools_.push_back(std::move(definition));
    return true;
}

std::string ToolRegistry::published_name(const ToolDefinition& definition) const {
    return name_prefix_ + definition.name;
}

json ToolRegistry::catalog() const {
    json list = json::array();
    for (const auto& tool : tools_) {
        list.push_back(json{{"name", published_name(tool)},
                            {"description", tool.description},
                            {"inputSchema", tool.input_schema}});
    }
    return list;
}

const ToolDefinition* ToolRegistry::find(const std::string& name) const {
    std::string bare = name;
    if (!name_prefix_.empty() && name.rfind(name_prefix_, 0) == 0) {
        bare = name.substr(name_prefix_.size());
    }
    const auto it = index_.find(bare);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

core::errors::Result<protocol::ToolResult> ToolRegistry::call(
    const protocol::ToolCall& call) const {
    const ToolDefinition* tool = find(call.name);
    if (tool == nullptr) {
        return MobileError{ErrorCategory::Validation, "Unknown tool: " + call.name,
                           "unknown_tool"};
    }

    auto validated = validate_arguments(tool->input_schema, call.arguments);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }

    MOBILEMCP_LOG_DEBUG("calling " + tool->name + " with " +
                        core::errors::get_value(validated).dump());
    try {
        return tool->handler(core::errors::get_value(validated));
    } catch (const std::exception& e) {
        MOBILEMCP_LOG_ERROR("tool " + tool->name + " threw: " + e.what());
        return MobileError{ErrorCategory::Internal,
                           "Internal error in " + tool->name + ": " + e.what(),
                           "handler_exception"};
    }
}

}  // namespace mobilemcp::tools
