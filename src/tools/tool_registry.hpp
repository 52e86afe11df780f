#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/mobile_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace mobilemcp::tools {

// Receives arguments already validated and defaulted against the tool's schema.
using ToolHandler =
    std::function<core::errors::Result<protocol::ToolResult>(const nlohmann::json& arguments)>;

struct ToolDefinition {
    std::string name;  // bare name, e.g. "take_screenshot"
    std::string description;
    nlohmann::json input_schema;
    ToolHandler handler;
};

class ToolRegistry {
public:
    // Published names are name_prefix + bare name; lookups accept both forms.
    explicit ToolRegistry(std::string name_prefix = "");

    core::errors::Result<bool> register_tool(ToolDefinition definition);

    const std::vector<ToolDefinition>& tools() const { return tools_; }

    std::string published_name(const ToolDefinition& definition) const;

    // The tools/list payload: [{name, description, inputSchema}, ...] in registration order.
    nlohmann::json catalog() const;

    const ToolDefinition* find(const std::string& name) const;

    core::errors::Result<protocol::ToolResult> call(const protocol::ToolCall& call) const;

private:
    std::string name_prefix_;
    std::vector<ToolDefinition> tools_;
    std::map<std::string, std::size_t> index_;
};

}  // namespace mobilemcp::tools
