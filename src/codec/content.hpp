#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/mobile_errors.hpp"
#include "process/command_runner.hpp"
#include "protocol/jsonrpc_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace mobilemcp::codec {

bool is_png(const std::string& bytes);

std::string base64_encode(const std::string& bytes);

protocol::ContentBlock text_block(std::string text);
protocol::ContentBlock png_block(const std::string& png_bytes);

protocol::ToolResult text_result(std::string text);

nlohmann::json to_json(const protocol::ContentBlock& block);
nlohmann::json to_json(const protocol::ToolResult& result);

// JSON-RPC error for a tool failure; the hint, if any, is appended to the message.
protocol::RpcError to_rpc_error(const core::errors::MobileError& error);

int rpc_code_for(core::errors::ErrorCategory category);

// Turns a finished invocation into an error unless it launched, finished in time and exited 0.
core::errors::Result<process::CommandOutput> require_success(
    const process::CommandSpec& spec, const core::errors::Result<process::CommandOutput>& run);

// The diagnostic a failed tool left behind: stderr, or stdout when stderr is empty.
std::string diagnostic_text(const process::CommandOutput& output);

}  // namespace mobilemcp::codec
