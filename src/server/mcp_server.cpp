#include "server/mcp_server.hpp"

#include <istream>
#include <ostream>
#include <utility>
#include "codec/content.hpp"
#include "core/logging/logger.hpp"

namespace mobilemcp::server {

using nlohmann::json;
using core::errors::ErrorCategory;
using core::errors::MobileError;

namespace {

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Ids are strings or numbers; anything else is answered with null.
json usable_id(const json& message) {
    if (!message.is_object()) {
        return nullptr;
    }
    const auto it = message.find("id");
    if (it == message.end() || !(it->is_string() || it->is_number())) {
        return nullptr;
    }
    return *it;
}

}  // namespace

json make_result(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, const int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

json make_error(const json& id, const core::errors::MobileError& error) {
    const auto rpc = codec::to_rpc_error(error);
    return make_error(id, rpc.code, rpc.message);
}

McpServer::McpServer(const tools::ToolRegistry& registry, protocol::ServerIdentity identity)
    : registry_(registry), identity_(std::move(identity)) {}

std::optional<json> McpServer::handle_line(const std::string& line) const {
    if (is_blank(line)) {
        return std::nullopt;
    }

    const json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        MOBILEMCP_LOG_WARN("Unparsable request line (" + std::to_string(line.size()) + " bytes)");
        return make_error(nullptr,
                          MobileError{ErrorCategory::Protocol, "Parse error", "parse_error"});
    }

    const json id = usable_id(message);
    if (!message.is_object()) {
        return make_error(id, MobileError{ErrorCategory::Protocol,
                                          "Invalid Request: expected a JSON object",
                                          "invalid_request"});
    }
    if (message.contains("jsonrpc") &&
        !(message.at("jsonrpc").is_string() && message.at("jsonrpc") == "2.0")) {
        return make_error(id, MobileError{ErrorCategory::Protocol,
                                          "Invalid Request: 'jsonrpc' must be \"2.0\"",
                                          "invalid_request"});
    }
    if (!message.contains("method") || !message.at("method").is_string()) {
        return make_error(id, MobileError{ErrorCategory::Protocol,
                                          "Invalid Request: missing 'method'", "invalid_request"});
    }

    protocol::RpcRequest request;
    request.method = message.at("method").get<std::string>();
    if (message.contains("params")) {
        request.params = message.at("params");
    }

    if (!message.contains("id")) {
        MOBILEMCP_LOG_DEBUG("notification: " + request.method);
        return std::nullopt;
    }
    request.id = message.at("id");

    auto& logger = core::logging::Logger::get();
    logger.set_context(request.method + " #" + request.id->dump());
    json response = dispatch(id, request);
    logger.clear_context();
    return response;
}

json McpServer::dispatch(const json& id, const protocol::RpcRequest& request) const {
    MOBILEMCP_LOG_DEBUG("request received");

    if (request.method == "initialize") {
        return make_result(id, json{{"protocolVersion", identity_.protocol_version},
                                    {"capabilities", {{"tools", json::object()}}},
                                    {"serverInfo",
                                     {{"name", identity_.name}, {"version", identity_.version}}}});
    }
    if (request.method == "ping") {
        return make_result(id, json::object());
    }
    if (request.method == "tools/list") {
        return make_result(id, json{{"tools", registry_.catalog()}});
    }
    if (request.method == "tools/call") {
        return handle_tools_call(id, request);
    }
    return make_error(id, MobileError{ErrorCategory::Protocol, "Method not found: " + request.method,
                                      "method_not_found"});
}

json McpServer::handle_tools_call(const json& id, const protocol::RpcRequest& request) const {
    if (!request.params.is_object()) {
        return make_error(id, MobileError{ErrorCategory::Validation,
                                          "Invalid params: expected an object", "invalid_params"});
    }
    const auto name_it = request.params.find("name");
    if (name_it == request.params.end() || !name_it->is_string()) {
        return make_error(id, MobileError{ErrorCategory::Validation,
                                          "Invalid params: missing tool 'name'", "invalid_params"});
    }

    protocol::ToolCall call;
    call.name = name_it->get<std::string>();
    call.arguments = json::object();
    const auto args_it = request.params.find("arguments");
    if (args_it != request.params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            return make_error(id, MobileError{ErrorCategory::Validation,
                                              "Invalid params: 'arguments' must be an object",
                                              "invalid_params"});
        }
        call.arguments = *args_it;
    }

    auto result = registry_.call(call);
    if (core::errors::is_error(result)) {
        const auto& err = core::errors::get_error(result);
        MOBILEMCP_LOG_INFO(call.name + " failed [" + err.code + "]: " + err.message);
        return make_error(id, err);
    }
    return make_result(id, codec::to_json(core::errors::get_value(result)));
}

std::size_t McpServer::serve(std::istream& in, std::ostream& out) const {
    std::size_t answered = 0;
    std::string line;
    while (std::getline(in, line)) {
        auto response = handle_line(line);
        if (!response) {
            continue;
        }
        // Tool diagnostics may carry bytes that are not valid UTF-8.
        out << response->dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
        out.flush();
        ++answered;
    }
    MOBILEMCP_LOG_INFO("End of input after " + std::to_string(answered) + " responses");
    return answered;
}

}  // namespace mobilemcp::server
