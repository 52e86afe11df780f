#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include "core/errors/mobile_errors.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::core::config {

constexpr std::uint32_t kDefaultTimeoutMs = 30000;
constexpr std::uint32_t kMaxTimeoutMs = 3600000;
constexpr std::uint32_t kInstallTimeoutFloorMs = 300000;

// Where the Android debug bridge server lives. Handed to the Android driver explicitly.
struct AdbEndpoint {
    std::string adb_path = "adb";
    std::string server_host = "127.0.0.1";
    std::uint16_t server_port = 5037;
};

struct ServerConfig {
    bool debug = false;
    protocol::PlatformSelector default_platform = protocol::PlatformSelector::Auto;
    AdbEndpoint adb;
    std::string xcrun_path = "xcrun";
    std::uint32_t timeout_ms = kDefaultTimeoutMs;
    protocol::UiDumpPolicy ui_dump_policy = protocol::UiDumpPolicy::Strict;
};

// Returns the value of an environment variable, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

EnvLookup process_environment();

// Reads MOBILE_DEVICE_MCP_* / MOBILE_PLATFORM / ANDROID_ADB_SERVER_* on top of `base`.
errors::Result<ServerConfig> apply_environment(ServerConfig base, const EnvLookup& env);

errors::Result<std::uint32_t> parse_timeout_ms(const std::string& text);
errors::Result<std::uint16_t> parse_port(const std::string& text);

}  // namespace mobilemcp::core::config
