#include "codec/content.hpp"

#include <cstdint>

namespace mobilemcp::codec {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using nlohmann::json;
using protocol::ContentBlock;
using protocol::ContentType;
using protocol::ToolResult;

namespace {

const char kBase64Table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

}  // namespace

bool is_png(const std::string& bytes) {
    static const unsigned char kSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (bytes.size() < sizeof(kSignature)) {
        return false;
    }
    for (std::size_t i = 0; i < sizeof(kSignature); ++i) {
        if (static_cast<unsigned char>(bytes[i]) != kSignature[i]) {
            return false;
        }
    }
    return true;
}

std::string base64_encode(const std::string& bytes) {
    const auto* data = reinterpret_cast<const unsigned char*>(bytes.data());
    const std::size_t len = bytes.size();
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (std::size_t i = 0; i < len; i += 3) {
        std::uint32_t n = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<std::uint32_t>(data[i + 2]);

        result.push_back(kBase64Table[(n >> 18) & 0x3F]);
        result.push_back(kBase64Table[(n >> 12) & 0x3F]);
        result.push_back((i + 1 < len) ? kBase64Table[(n >> 6) & 0x3F] : '=');
        result.push_back((i + 2 < len) ? kBase64Table[n & 0x3F] : '=');
    }
    return result;
}

ContentBlock text_block(std::string text) {
    ContentBlock block;
    block.type = ContentType::Text;
    block.text = std::move(text);
    return block;
}

ContentBlock png_block(const std::string& png_bytes) {
    ContentBlock block;
    block.type = ContentType::Image;
    block.data = base64_encode(png_bytes);
    block.mime_type = "image/png";
    return block;
}

ToolResult text_result(std::string text) {
    ToolResult result;
    result.content.push_back(text_block(std::move(text)));
    return result;
}

json to_json(const ContentBlock& block) {
    if (block.type == ContentType::Image) {
        return json{{"type", "image"}, {"data", block.data}, {"mimeType", block.mime_type}};
    }
    return json{{"type", "text"}, {"text", block.text}};
}

json to_json(const ToolResult& result) {
    json content = json::array();
    for (const auto& block : result.content) {
        content.push_back(to_json(block));
    }
    return json{{"content", content}};
}

int rpc_code_for(const ErrorCategory category) {
    namespace codes = protocol::rpc_codes;
    switch (category) {
        case ErrorCategory::Protocol: return codes::kInvalidRequest;
        case ErrorCategory::Validation: return codes::kInvalidParams;
        case ErrorCategory::Device: return codes::kDeviceError;
        case ErrorCategory::PlatformUnsupported: return codes::kPlatformUnsupported;
        case ErrorCategory::Subprocess: return codes::kSubprocessError;
        case ErrorCategory::Io: return codes::kIoError;
        case ErrorCategory::Internal: return codes::kInternalError;
    }
    return codes::kInternalError;
}

protocol::RpcError to_rpc_error(const MobileError& error) {
    std::string message = error.message;
    if (!error.hint.empty()) {
        message += " (hint: " + error.hint + ")";
    }
    int code = rpc_code_for(error.category);
    // Protocol errors carry their JSON-RPC flavour in the error code.
    if (error.category == ErrorCategory::Protocol) {
        if (error.code == "parse_error") {
            code = protocol::rpc_codes::kParseError;
        } else if (error.code == "method_not_found") {
            code = protocol::rpc_codes::kMethodNotFound;
        }
    }
    return protocol::RpcError{code, message};
}

std::string diagnostic_text(const process::CommandOutput& output) {
    std::string text = trim(output.stderr_text);
    if (text.empty()) {
        text = trim(output.stdout_text);
    }
    constexpr std::size_t kMaxDiagnostic = 1000;
    if (text.size() > kMaxDiagnostic) {
        text = text.substr(0, kMaxDiagnostic) + "...";
    }
    return text;
}

core::errors::Result<process::CommandOutput> require_success(
    const process::CommandSpec& spec, const core::errors::Result<process::CommandOutput>& run) {
    if (core::errors::is_error(run)) {
        return core::errors::get_error(run);
    }
    const auto& output = core::errors::get_value(run);
    const std::string program = spec.argv.empty() ? "command" : spec.argv.front();

    if (output.timed_out) {
        return MobileError{ErrorCategory::Subprocess,
                           "`" + process::describe(spec) + "` timed out after " +
                               std::to_string(spec.timeout_ms) + " ms",
                           "subprocess_timeout"};
    }
    if (output.launch_failed) {
        const std::string detail = diagnostic_text(output);
        return MobileError{ErrorCategory::Subprocess,
                           "Failed to launch " + program + (detail.empty() ? "" : ": " + detail),
                           "tool_not_found", "Check that " + program + " is installed and on PATH."};
    }
    if (output.exit_code != 0) {
        const std::string detail = diagnostic_text(output);
        return MobileError{ErrorCategory::Subprocess,
                           "`" + process::describe(spec) + "` failed with exit code " +
                               std::to_string(output.exit_code) +
                               (detail.empty() ? "" : ": " + detail),
                           "subprocess_failed"};
    }
    return output;
}

}  // namespace mobilemcp::codec
