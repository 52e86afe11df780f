#include "app/cli_parser.hpp"
#include <optional>
#include <vector>

namespace mobilemcp::app::cli {

    using namespace mobilemcp::core::errors;
    using mobilemcp::core::config::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> platform;
        std::optional<std::string> adb;
        std::optional<std::string> adb_host;
        std::optional<std::string> adb_port;
        std::optional<std::string> xcrun;
        std::optional<std::string> timeout_ms;
        std::optional<std::string> ui_dump;
        bool debug = false;
        bool help = false;
    };

    std::string usage_text() {
        return "Usage: mobile_device_mcp [options]\n"
               "\n"
               "Serves MCP tools over stdin/stdout for Android (adb) and iOS (xcrun simctl).\n"
               "\n"
               "Options:\n"
               "  --platform android|ios|auto   Default platform when a tool call names none\n"
               "  --adb PATH                    adb executable (default: adb)\n"
               "  --adb-host HOST               adb server host (default: 127.0.0.1)\n"
               "  --adb-port PORT               adb server port (default: 5037)\n"
               "  --xcrun PATH                  xcrun executable (default: xcrun)\n"
               "  --timeout-ms N                Per-command timeout (default: 30000)\n"
               "  --ui-dump strict|partial      Handling of truncated UI hierarchy dumps\n"
               "  --debug                       Verbose logging on stderr\n"
               "  --help                        Print this message\n";
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[], const ServerConfig& base) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        auto take_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool ok = true;
            if (flag == "--platform") {
                ok = take_value(i, raw.platform);
            } else if (flag == "--adb") {
                ok = take_value(i, raw.adb);
            } else if (flag == "--adb-host") {
                ok = take_value(i, raw.adb_host);
            } else if (flag == "--adb-port") {
                ok = take_value(i, raw.adb_port);
            } else if (flag == "--xcrun") {
                ok = take_value(i, raw.xcrun);
            } else if (flag == "--timeout-ms") {
                ok = take_value(i, raw.timeout_ms);
            } else if (flag == "--ui-dump") {
                ok = take_value(i, raw.ui_dump);
            } else if (flag == "--debug") {
                raw.debug = true;
            } else if (flag == "--help" || flag == "-h") {
                raw.help = true;
            } else {
                return MobileError{ErrorCategory::Validation, "Unknown argument: " + flag,
                                   "unknown_argument", "Run with --help for the option list."};
            }
            if (!ok) {
                return MobileError{ErrorCategory::Validation, "Missing value for " + flag,
                                   "missing_value"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CliOptions options;
        options.config = base;
        options.show_help = raw.help;
        if (raw.help) {
            return options;
        }
        ServerConfig& config = options.config;

        if (raw.debug) {
            config.debug = true;
        }

        if (raw.platform) {
            auto selector = mobilemcp::protocol::parse_platform_selector(*raw.platform);
            if (!selector) {
                return MobileError{ErrorCategory::Validation,
                                   "Invalid value for --platform: " + *raw.platform,
                                   "invalid_platform", "Use android, ios or auto."};
            }
            config.default_platform = *selector;
        }

        if (raw.adb) {
            if (raw.adb->empty()) {
                return MobileError{ErrorCategory::Validation, "--adb cannot be empty",
                                   "invalid_path"};
            }
            config.adb.adb_path = *raw.adb;
        }
        if (raw.adb_host) {
            if (raw.adb_host->empty()) {
                return MobileError{ErrorCategory::Validation, "--adb-host cannot be empty",
                                   "invalid_host"};
            }
            config.adb.server_host = *raw.adb_host;
        }
        if (raw.adb_port) {
            auto port = mobilemcp::core::config::parse_port(*raw.adb_port);
            if (is_error(port)) {
                return get_error(port);
            }
            config.adb.server_port = get_value(port);
        }
        if (raw.xcrun) {
            if (raw.xcrun->empty()) {
                return MobileError{ErrorCategory::Validation, "--xcrun cannot be empty",
                                   "invalid_path"};
            }
            config.xcrun_path = *raw.xcrun;
        }

        // Exception-free integer parsing
        if (raw.timeout_ms) {
            auto timeout = mobilemcp::core::config::parse_timeout_ms(*raw.timeout_ms);
            if (is_error(timeout)) {
                return get_error(timeout);
            }
            config.timeout_ms = get_value(timeout);
        }

        if (raw.ui_dump) {
            auto policy = mobilemcp::protocol::parse_ui_dump_policy(*raw.ui_dump);
            if (!policy) {
                return MobileError{ErrorCategory::Validation,
                                   "Invalid value for --ui-dump: " + *raw.ui_dump,
                                   "invalid_ui_dump_policy", "Use strict or partial."};
            }
            config.ui_dump_policy = *policy;
        }

        return options;
    }

} // namespace mobilemcp::app::cli
