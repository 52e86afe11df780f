#pragma once

#include "codec/artifact_writer.hpp"
#include "devices/device_manager.hpp"
#include "protocol/device_contract.hpp"
#include "tools/tool_registry.hpp"

namespace mobilemcp::tools {

constexpr const char* kToolPrefix = "mobile_device_mcp_";

// Registers the 19 device tools in catalog order. Handlers hold references to
// `manager` and `writer`; both must outlive the registry.
core::errors::Result<bool> register_mobile_tools(ToolRegistry& registry,
                                                 const devices::DeviceManager& manager,
                                                 const codec::ArtifactWriter& writer,
                                                 protocol::PlatformSelector default_platform);

}  // namespace mobilemcp::tools
