#include "devices/ios_driver.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <sstream>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <utility>
#include "codec/artifact_writer.hpp"
#include "codec/content.hpp"
#include "codec/simctl_codec.hpp"
#include "core/config/server_config.hpp"
#include "core/logging/logger.hpp"

namespace mobilemcp::devices {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using core::errors::Result;
using protocol::Device;
using protocol::DeviceKind;

namespace {

constexpr std::chrono::milliseconds kDoubleTapGap{50};

// simctl accepts fractional points; print integers without a trailing ".0".
std::string coordinate(const double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

std::string point_text(const double x, const double y) {
    return "(" + coordinate(x) + ", " + coordinate(y) + ")";
}

MobileError unsupported(const std::string& operation, const Device& device) {
    return MobileError{ErrorCategory::PlatformUnsupported,
                       operation + " is not supported on iOS " +
                           protocol::to_string(device.kind) + " devices",
                       "unsupported_operation"};
}

bool is_simulator(const Device& device) {
    return device.kind == DeviceKind::Simulator;
}

const char* simctl_button(const protocol::Button button) {
    switch (button) {
        case protocol::Button::Home: return "home";
        case protocol::Button::Power: return "power";
        case protocol::Button::VolumeUp: return "volumeUp";
        case protocol::Button::VolumeDown: return "volumeDown";
        default: return nullptr;
    }
}

}  // namespace

IosDriver::IosDriver(const process::CommandRunner& runner, std::string xcrun_path,
                     const std::uint32_t timeout_ms)
    : runner_(runner), xcrun_path_(std::move(xcrun_path)), timeout_ms_(timeout_ms) {}

Result<process::CommandOutput> IosDriver::simctl(std::vector<std::string> args,
                                                 const std::uint32_t timeout_ms) const {
    process::CommandSpec spec;
    spec.timeout_ms = timeout_ms;
    spec.argv = {xcrun_path_, "simctl"};
    for (auto& arg : args) {
        spec.argv.push_back(std::move(arg));
    }
    return codec::require_success(spec, runner_.run(spec));
}

Result<process::CommandOutput> IosDriver::simctl(std::vector<std::string> args) const {
    return simctl(std::move(args), timeout_ms_);
}

Result<std::vector<Device>> IosDriver::list_devices() const {
    std::vector<Device> devices;

    process::CommandSpec sim_spec;
    sim_spec.timeout_ms = timeout_ms_;
    sim_spec.argv = {xcrun_path_, "simctl", "list", "devices", "available", "--json"};
    auto sim_run = runner_.run(sim_spec);
    if (!core::errors::is_error(sim_run) && core::errors::get_value(sim_run).launch_failed) {
        MOBILEMCP_LOG_DEBUG("xcrun not found at '" + xcrun_path_ + "', no iOS simulators");
    } else {
        auto checked = codec::require_success(sim_spec, sim_run);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        auto simulators =
            codec::simctl::parse_devices_json(core::errors::get_value(checked).stdout_text);
        if (core::errors::is_error(simulators)) {
            return core::errors::get_error(simulators);
        }
        devices = core::errors::get_value(simulators);
    }

    process::CommandSpec usb_spec;
    usb_spec.timeout_ms = timeout_ms_;
    usb_spec.argv = {"idevice_id", "-l"};
    auto usb_run = runner_.run(usb_spec);
    if (!core::errors::is_error(usb_run) && core::errors::get_value(usb_run).launch_failed) {
        MOBILEMCP_LOG_DEBUG("idevice_id not installed, skipping physical iOS devices");
        return devices;
    }
    auto usb_checked = codec::require_success(usb_spec, usb_run);
    if (core::errors::is_error(usb_checked)) {
        MOBILEMCP_LOG_WARN("idevice_id failed: " + core::errors::get_error(usb_checked).message);
        return devices;
    }
    for (auto& device :
         codec::simctl::parse_idevice_ids(core::errors::get_value(usb_checked).stdout_text)) {
        devices.push_back(std::move(device));
    }
    return devices;
}

Result<bool> IosDriver::check_ready(const Device& device) const {
    if (is_simulator(device) && device.state != "booted") {
        return MobileError{ErrorCategory::Device,
                           "iOS simulator " + device.id + " is " + device.state,
                           "device_not_ready",
                           "Boot it with `xcrun simctl boot " + device.id + "`."};
    }
    return true;
}

Result<std::string> IosDriver::physical_screenshot(const Device& device) const {
    std::error_code ec;
    auto tmp_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp_dir = "/tmp";
    }
    const auto tmp_file =
        tmp_dir / ("mobilemcp_" + device.id + "_" + std::to_string(getpid()) + ".png");

    process::CommandSpec spec;
    spec.timeout_ms = timeout_ms_;
    spec.argv = {"idevicescreenshot", "-u", device.id, tmp_file.string()};
    auto output = codec::require_success(spec, runner_.run(spec));
    if (core::errors::is_error(output)) {
        std::filesystem::remove(tmp_file, ec);
        return core::errors::get_error(output);
    }

    const codec::ArtifactWriter files{};
    auto bytes = files.read_bytes(tmp_file);
    std::filesystem::remove(tmp_file, ec);
    if (core::errors::is_error(bytes)) {
        return core::errors::get_error(bytes);
    }
    return core::errors::get_value(bytes);
}

Result<std::string> IosDriver::take_screenshot(const Device& device) const {
    std::string bytes;
    if (is_simulator(device)) {
        auto output = simctl({"io", device.id, "screenshot", "--type=png", "-"});
        if (core::errors::is_error(output)) {
            return core::errors::get_error(output);
        }
        bytes = core::errors::get_value(output).stdout_text;
    } else {
        auto captured = physical_screenshot(device);
        if (core::errors::is_error(captured)) {
            return core::errors::get_error(captured);
        }
        bytes = core::errors::get_value(captured);
    }

    if (!codec::is_png(bytes)) {
        return MobileError{ErrorCategory::Subprocess,
                           "Screenshot is not PNG data (" + std::to_string(bytes.size()) +
                               " bytes)",
                           "invalid_png"};
    }
    return bytes;
}

Result<protocol::ScreenSize> IosDriver::get_screen_size(const Device& device) const {
    if (!is_simulator(device)) {
        return unsupported("get_screen_size", device);
    }
    return codec::simctl::screen_size_for_model(device.model.empty() ? device.display_name
                                                                      : device.model);
}

Result<protocol::Orientation> IosDriver::get_orientation(const Device& device) const {
    return unsupported("get_orientation", device);
}

Result<std::vector<protocol::InstalledApp>> IosDriver::list_apps(const Device& device) const {
    if (!is_simulator(device)) {
        return unsupported("list_apps", device);
    }
    auto output = simctl({"listapps", device.id});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return codec::simctl::parse_listapps(core::errors::get_value(output).stdout_text);
}

Result<protocol::ElementListing> IosDriver::list_elements(const Device& device,
                                                          const std::string& /*filter*/) const {
    return unsupported("list_elements_on_screen", device);
}

Result<std::string> IosDriver::tap(const Device& device, const double x, const double y) const {
    if (!is_simulator(device)) {
        return unsupported("tap", device);
    }
    auto output = simctl({"io", device.id, "tap", coordinate(x), coordinate(y)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Tapped at " + point_text(x, y);
}

Result<std::string> IosDriver::double_tap(const Device& device, const double x,
                                          const double y) const {
    if (!is_simulator(device)) {
        return unsupported("double_tap", device);
    }
    auto first = simctl({"io", device.id, "tap", coordinate(x), coordinate(y)});
    if (core::errors::is_error(first)) {
        return core::errors::get_error(first);
    }
    std::this_thread::sleep_for(kDoubleTapGap);
    auto second = simctl({"io", device.id, "tap", coordinate(x), coordinate(y)});
    if (core::errors::is_error(second)) {
        return core::errors::get_error(second);
    }
    return "Double tapped at " + point_text(x, y);
}

Result<std::string> IosDriver::long_press(const Device& device, const double x, const double y,
                                          const std::int64_t duration_ms) const {
    if (!is_simulator(device)) {
        return unsupported("long_press", device);
    }
    auto output = simctl({"io", device.id, "tap", coordinate(x), coordinate(y)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Long press at " + point_text(x, y) + " performed as a tap; the " +
           std::to_string(duration_ms) + "ms duration was not honored (iOS simulator limitation)";
}

Result<std::string> IosDriver::swipe(const Device& device, const double start_x,
                                     const double start_y, const double end_x, const double end_y,
                                     const std::int64_t /*duration_ms*/) const {
    if (!is_simulator(device)) {
        return unsupported("swipe", device);
    }
    auto output = simctl({"io", device.id, "swipe", coordinate(start_x), coordinate(start_y),
                          coordinate(end_x), coordinate(end_y)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Swiped from " + point_text(start_x, start_y) + " to " + point_text(end_x, end_y);
}

Result<std::string> IosDriver::type_text(const Device& device, const std::string& text) const {
    if (!is_simulator(device)) {
        return unsupported("type_keys", device);
    }
    if (text.empty()) {
        return std::string("Nothing to type");
    }
    auto output = simctl({"io", device.id, "type", text});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Typed text: " + text;
}

Result<std::string> IosDriver::press_button(const Device& device,
                                            const protocol::Button button) const {
    if (!is_simulator(device)) {
        return unsupported("press_button", device);
    }
    const char* name = simctl_button(button);
    if (name == nullptr) {
        return MobileError{ErrorCategory::PlatformUnsupported,
                           "Button " + protocol::to_string(button) +
                               " is not supported on iOS simulator devices",
                           "unsupported_button", "Use home, power, volume_up or volume_down."};
    }
    auto output = simctl({"io", device.id, "press", name});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Pressed " + protocol::to_string(button);
}

Result<std::string> IosDriver::launch_app(const Device& device, const std::string& app_id) const {
    if (!is_simulator(device)) {
        return unsupported("launch_app", device);
    }
    auto output = simctl({"launch", device.id, app_id});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Launched " + app_id;
}

Result<std::string> IosDriver::terminate_app(const Device& device,
                                             const std::string& app_id) const {
    if (!is_simulator(device)) {
        return unsupported("terminate_app", device);
    }
    auto output = simctl({"terminate", device.id, app_id});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Terminated " + app_id;
}

Result<std::string> IosDriver::install_app(const Device& device,
                                           const std::string& app_path) const {
    if (!is_simulator(device)) {
        return unsupported("install_app", device);
    }
    std::error_code ec;
    if (!std::filesystem::exists(app_path, ec) || ec) {
        return MobileError{ErrorCategory::Validation, "App file not found: " + app_path,
                           "app_path_not_found"};
    }
    auto output = simctl({"install", device.id, app_path},
                         std::max(timeout_ms_, core::config::kInstallTimeoutFloorMs));
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Installed " + app_path;
}

Result<std::string> IosDriver::uninstall_app(const Device& device,
                                             const std::string& app_id) const {
    if (!is_simulator(device)) {
        return unsupported("uninstall_app", device);
    }
    auto output = simctl({"uninstall", device.id, app_id});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Uninstalled " + app_id;
}

Result<std::string> IosDriver::open_url(const Device& device, const std::string& url) const {
    if (!is_simulator(device)) {
        return unsupported("open_url", device);
    }
    auto output = simctl({"openurl", device.id, url});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Opened " + url;
}

Result<std::string> IosDriver::set_orientation(const Device& device,
                                               const protocol::Orientation orientation) const {
    if (!is_simulator(device)) {
        return unsupported("set_orientation", device);
    }
    auto output = simctl({"io", device.id, "orientation", protocol::to_string(orientation)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Orientation set to " + protocol::to_string(orientation);
}

}  // namespace mobilemcp::devices
