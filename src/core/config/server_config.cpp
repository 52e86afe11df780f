#include "core/config/server_config.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace mobilemcp::core::config {

using errors::ErrorCategory;
using errors::MobileError;

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

errors::Result<std::uint32_t> parse_timeout_ms(const std::string& text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return MobileError{ErrorCategory::Validation,
                           "Invalid timeout value: " + text, "invalid_integer",
                           "Provide the timeout in milliseconds."};
    }
    if (value == 0 || value > kMaxTimeoutMs) {
        return MobileError{ErrorCategory::Validation, "Timeout out of bounds: " + text,
                           "bounds_error", "Must be between 1 and 3600000."};
    }
    return value;
}

errors::Result<std::uint16_t> parse_port(const std::string& text) {
    unsigned int value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return MobileError{ErrorCategory::Validation, "Invalid port value: " + text,
                           "invalid_integer"};
    }
    if (value == 0 || value > 65535) {
        return MobileError{ErrorCategory::Validation, "Port out of bounds: " + text,
                           "bounds_error", "Must be between 1 and 65535."};
    }
    return static_cast<std::uint16_t>(value);
}

errors::Result<ServerConfig> apply_environment(ServerConfig base, const EnvLookup& env) {
    ServerConfig config = std::move(base);

    // Presence alone turns debug on, whatever the value.
    if (env("MOBILE_DEVICE_MCP_DEBUG")) {
        config.debug = true;
    }

    if (auto platform = env("MOBILE_PLATFORM")) {
        auto selector = protocol::parse_platform_selector(*platform);
        if (!selector) {
            return MobileError{ErrorCategory::Validation,
                               "MOBILE_PLATFORM must be android, ios or auto, got: " +
                                   *platform,
                               "invalid_platform"};
        }
        config.default_platform = *selector;
    }

    if (auto adb = env("MOBILE_DEVICE_MCP_ADB"); adb && !adb->empty()) {
        config.adb.adb_path = *adb;
    }
    if (auto host = env("ANDROID_ADB_SERVER_ADDRESS"); host && !host->empty()) {
        config.adb.server_host = *host;
    }
    if (auto port = env("ANDROID_ADB_SERVER_PORT")) {
        auto parsed = parse_port(*port);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.adb.server_port = errors::get_value(parsed);
    }
    if (auto xcrun = env("MOBILE_DEVICE_MCP_XCRUN"); xcrun && !xcrun->empty()) {
        config.xcrun_path = *xcrun;
    }
    if (auto timeout = env("MOBILE_DEVICE_MCP_TIMEOUT_MS")) {
        auto parsed = parse_timeout_ms(*timeout);
        if (errors::is_error(parsed)) {
            return errors::get_error(parsed);
        }
        config.timeout_ms = errors::get_value(parsed);
    }
    if (auto policy = env("MOBILE_DEVICE_MCP_UI_DUMP")) {
        auto parsed = protocol::parse_ui_dump_policy(*policy);
        if (!parsed) {
            return MobileError{ErrorCategory::Validation,
                               "MOBILE_DEVICE_MCP_UI_DUMP must be strict or partial, got: " +
                                   *policy,
                               "invalid_ui_dump_policy"};
        }
        config.ui_dump_policy = *parsed;
    }

    return config;
}

}  // namespace mobilemcp::core::config
