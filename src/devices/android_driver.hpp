#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/config/server_config.hpp"
#include "core/errors/mobile_errors.hpp"
#include "process/command_runner.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::devices {

// Drives Android devices and emulators through `adb`. Every invocation is
// `adb -H <host> -P <port> -s <serial> ...` against the configured endpoint.
class AndroidDriver {
public:
    AndroidDriver(const process::CommandRunner& runner, core::config::AdbEndpoint endpoint,
                  std::uint32_t timeout_ms, protocol::UiDumpPolicy ui_dump_policy);

    // A missing adb binary yields an empty list rather than an error.
    core::errors::Result<std::vector<protocol::Device>> list_devices() const;

    // Only devices in state "device" accept commands.
    core::errors::Result<bool> check_ready(const protocol::Device& device) const;

    core::errors::Result<std::string> take_screenshot(const protocol::Device& device) const;
    core::errors::Result<protocol::ScreenSize> get_screen_size(const protocol::Device& device) const;
    core::errors::Result<protocol::Orientation> get_orientation(
        const protocol::Device& device) const;
    core::errors::Result<std::vector<protocol::InstalledApp>> list_apps(
        const protocol::Device& device) const;
    core::errors::Result<protocol::ElementListing> list_elements(const protocol::Device& device,
                                                                 const std::string& filter) const;

    core::errors::Result<std::string> tap(const protocol::Device& device, double x, double y) const;
    core::errors::Result<std::string> double_tap(const protocol::Device& device, double x,
                                                 double y) const;
    core::errors::Result<std::string> long_press(const protocol::Device& device, double x,
                                                 double y, std::int64_t duration_ms) const;
    core::errors::Result<std::string> swipe(const protocol::Device& device, double start_x,
                                            double start_y, double end_x, double end_y,
                                            std::int64_t duration_ms) const;
    core::errors::Result<std::string> type_text(const protocol::Device& device,
                                                const std::string& text) const;
    core::errors::Result<std::string> press_button(const protocol::Device& device,
                                                   protocol::Button button) const;

    core::errors::Result<std::string> launch_app(const protocol::Device& device,
                                                 const std::string& app_id) const;
    core::errors::Result<std::string> terminate_app(const protocol::Device& device,
                                                    const std::string& app_id) const;
    core::errors::Result<std::string> install_app(const protocol::Device& device,
                                                  const std::string& app_path) const;
    core::errors::Result<std::string> uninstall_app(const protocol::Device& device,
                                                    const std::string& app_id) const;

    core::errors::Result<std::string> open_url(const protocol::Device& device,
                                               const std::string& url) const;
    core::errors::Result<std::string> set_orientation(const protocol::Device& device,
                                                      protocol::Orientation orientation) const;

private:
    process::CommandSpec command(const protocol::Device* device,
                                 std::vector<std::string> args) const;

    // Runs and requires a clean exit.
    core::errors::Result<process::CommandOutput> adb(const protocol::Device& device,
                                                     std::vector<std::string> args) const;

    core::errors::Result<process::CommandOutput> adb_shell(const protocol::Device& device,
                                                           std::vector<std::string> args) const;

    std::string active_display_id(const protocol::Device& device) const;
    bool devicekit_installed(const protocol::Device& device) const;
    core::errors::Result<std::string> paste_via_devicekit(const protocol::Device& device,
                                                          const std::string& text) const;

    const process::CommandRunner& runner_;
    core::config::AdbEndpoint endpoint_;
    std::uint32_t timeout_ms_;
    protocol::UiDumpPolicy ui_dump_policy_;
};

}  // namespace mobilemcp::devices
