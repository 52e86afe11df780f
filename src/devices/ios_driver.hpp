#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "core/errors/mobile_errors.hpp"
#include "process/command_runner.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::devices {

// Drives iOS simulators through `xcrun simctl`. Physical devices are limited
// to discovery and screenshots via the libimobiledevice command-line tools.
class IosDriver {
public:
    IosDriver(const process::CommandRunner& runner, std::string xcrun_path,
              std::uint32_t timeout_ms);

    core::errors::Result<std::vector<protocol::Device>> list_devices() const;

    // Simulators must be booted.
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
    // simctl cannot hold a touch; degrades to a tap and says so.
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
    core::errors::Result<process::CommandOutput> simctl(std::vector<std::string> args,
                                                        std::uint32_t timeout_ms) const;
    core::errors::Result<process::CommandOutput> simctl(std::vector<std::string> args) const;
    core::errors::Result<std::string> physical_screenshot(const protocol::Device& device) const;

    const process::CommandRunner& runner_;
    std::string xcrun_path_;
    std::uint32_t timeout_ms_;
};

}  // namespace mobilemcp::devices
