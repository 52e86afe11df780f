#pragma once
#include <string>
#include <variant>

namespace mobilemcp::core::errors {

    // 1. Typed error categories, one per failure family a tool call can hit
    enum class ErrorCategory {
        Protocol,             // Malformed JSON-RPC line, unknown method
        Validation,           // Missing/mistyped arguments, unknown tool or button
        Device,               // No matching device, ambiguous id, offline device
        PlatformUnsupported,  // Operation not available for this platform/kind
        Subprocess,           // External tool failed, timed out or printed garbage
        Io,                   // Could not write a requested output file
        Internal              // C++ logic bug or unexpected exception
    };

    // The standardized error payload
    struct MobileError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or a MobileError.
    template <typename T>
    using Result = std::variant<T, MobileError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<MobileError>(result);
    }

    template <typename T>
    const MobileError& get_error(const Result<T>& result) {
        return std::get<MobileError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::Device: return "device";
            case ErrorCategory::PlatformUnsupported: return "platform_unsupported";
            case ErrorCategory::Subprocess: return "subprocess";
            case ErrorCategory::Io: return "io";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace mobilemcp::core::errors
