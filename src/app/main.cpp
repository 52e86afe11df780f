#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "codec/artifact_writer.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/mobile_errors.hpp"
#include "core/logging/logger.hpp"
#include "devices/android_driver.hpp"
#include "devices/device_manager.hpp"
#include "devices/ios_driver.hpp"
#include "process/subprocess_runner.hpp"
#include "server/mcp_server.hpp"
#include "tools/mobile_tools.hpp"
#include "tools/tool_registry.hpp"

int main(int argc, char* argv[]) {
    using mobilemcp::core::errors::get_error;
    using mobilemcp::core::errors::get_value;
    using mobilemcp::core::errors::is_error;

    // 1. Defaults, then environment, then flags
    auto from_env = mobilemcp::core::config::apply_environment(
        mobilemcp::core::config::ServerConfig{},
        mobilemcp::core::config::process_environment());
    if (is_error(from_env)) {
        const auto& err = get_error(from_env);
        MOBILEMCP_LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        return 2;
    }

    auto parsed = mobilemcp::app::cli::parse_and_validate(argc, argv, get_value(from_env));
    if (is_error(parsed)) {
        const auto& err = get_error(parsed);
        MOBILEMCP_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            MOBILEMCP_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& options = get_value(parsed);
    if (options.show_help) {
        std::cerr << mobilemcp::app::cli::usage_text();
        return 0;
    }
    const auto& config = options.config;

    // 2. Logging goes to stderr; stdout is reserved for protocol responses
    auto& logger = mobilemcp::core::logging::Logger::get();
    logger.set_min_level(config.debug ? mobilemcp::core::logging::LogLevel::DEBUG
                                      : mobilemcp::core::logging::LogLevel::INFO);
    MOBILEMCP_LOG_INFO("mobile-device-mcp-server starting (platform=" +
                       mobilemcp::protocol::to_string(config.default_platform) +
                       ", ui_dump=" + mobilemcp::protocol::to_string(config.ui_dump_policy) +
                       ", timeout=" + std::to_string(config.timeout_ms) + "ms)");
    MOBILEMCP_LOG_DEBUG("adb server at " + config.adb.server_host + ":" +
                        std::to_string(config.adb.server_port) + " via " + config.adb.adb_path);

    // 3. Wire drivers, device manager and tool catalog
    const mobilemcp::process::SubprocessRunner runner{};
    const mobilemcp::devices::AndroidDriver android(runner, config.adb, config.timeout_ms,
                                                    config.ui_dump_policy);
    const mobilemcp::devices::IosDriver ios(runner, config.xcrun_path, config.timeout_ms);
    const mobilemcp::devices::DeviceManager manager(android, ios);
    const mobilemcp::codec::ArtifactWriter writer{};

    mobilemcp::tools::ToolRegistry registry(mobilemcp::tools::kToolPrefix);
    auto registered = mobilemcp::tools::register_mobile_tools(registry, manager, writer,
                                                              config.default_platform);
    if (is_error(registered)) {
        const auto& err = get_error(registered);
        MOBILEMCP_LOG_ERROR("Failed to build tool catalog [" + err.code + "]: " + err.message);
        return 3;
    }
    MOBILEMCP_LOG_DEBUG(std::to_string(registry.tools().size()) + " tools registered");

    // 4. Serve until the host closes stdin
    std::ios::sync_with_stdio(false);
    const mobilemcp::server::McpServer server(registry);
    server.serve(std::cin, std::cout);
    return 0;
}
