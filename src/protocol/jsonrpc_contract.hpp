#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace mobilemcp::protocol {

    // Standard JSON-RPC 2.0 codes plus the server-defined range used for tool failures.
    namespace rpc_codes {
        constexpr int kParseError = -32700;
        constexpr int kInvalidRequest = -32600;
        constexpr int kMethodNotFound = -32601;
        constexpr int kInvalidParams = -32602;
        constexpr int kInternalError = -32603;

        constexpr int kDeviceError = -32001;
        constexpr int kPlatformUnsupported = -32002;
        constexpr int kSubprocessError = -32003;
        constexpr int kIoError = -32004;
    } // namespace rpc_codes

    struct RpcRequest {
        std::optional<nlohmann::json> id;   // absent => notification
        std::string method;
        nlohmann::json params = nlohmann::json::object();
    };

    struct RpcError {
        int code;
        std::string message;
    };

    struct ServerIdentity {
        std::string protocol_version = "2024-11-05";
        std::string name = "mobile-device-mcp-server";
        std::string version = "1.0.0";
    };

} // namespace mobilemcp::protocol
