#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace mobilemcp::protocol {

    // How the orchestrator asks for a device operation (params of tools/call)
    struct ToolCall {
        std::string name;           // e.g., "mobile_device_mcp_take_screenshot"
        nlohmann::json arguments;   // always a JSON object once accepted
    };

    enum class ContentType {
        Text,
        Image
    };

    // One entry of the "content" array sent back to the orchestrator.
    struct ContentBlock {
        ContentType type = ContentType::Text;
        std::string text;       // ContentType::Text
        std::string data;       // ContentType::Image, already base64 encoded
        std::string mime_type;  // ContentType::Image
    };

    // A successful tool call. Failures travel as core::errors::MobileError instead.
    struct ToolResult {
        std::vector<ContentBlock> content;
    };

} // namespace mobilemcp::protocol
