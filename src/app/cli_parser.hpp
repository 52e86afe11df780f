#pragma once
#include <string>
#include "core/config/server_config.hpp"
#include "core/errors/mobile_errors.hpp"

namespace mobilemcp::app::cli {

    struct CliOptions {
        mobilemcp::core::config::ServerConfig config;
        bool show_help = false;
    };

    // Flags override whatever `base` already holds (defaults + environment).
    mobilemcp::core::errors::Result<CliOptions> parse_and_validate(
        int argc, char* argv[], const mobilemcp::core::config::ServerConfig& base);

    std::string usage_text();
}
