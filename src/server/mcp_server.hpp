#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/jsonrpc_contract.hpp"
#include "tools/tool_registry.hpp"

namespace mobilemcp::server {

// Newline-delimited JSON-RPC 2.0 over a pair of streams. One request is
// answered completely before the next line is read.
class McpServer {
public:
    explicit McpServer(const tools::ToolRegistry& registry,
                       protocol::ServerIdentity identity = protocol::ServerIdentity{});

    // Returns the response to write, or nullopt for blank lines and notifications.
    std::optional<nlohmann::json> handle_line(const std::string& line) const;

    // Serves until end of input. Returns the number of requests answered.
    std::size_t serve(std::istream& in, std::ostream& out) const;

private:
    nlohmann::json dispatch(const nlohmann::json& id, const protocol::RpcRequest& request) const;
    nlohmann::json handle_tools_call(const nlohmann::json& id,
                                     const protocol::RpcRequest& request) const;

    const tools::ToolRegistry& registry_;
    protocol::ServerIdentity identity_;
};

nlohmann::json make_result(const nlohmann::json& id, nlohmann::json result);
nlohmann::json make_error(const nlohmann::json& id, int code, const std::string& message);
nlohmann::json make_error(const nlohmann::json& id, const core::errors::MobileError& error);

}  // namespace mobilemcp::server
