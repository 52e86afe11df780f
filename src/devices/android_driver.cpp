#include "devices/android_driver.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <thread>
#include <utility>
#include "codec/adb_codec.hpp"
#include "codec/content.hpp"
#include "codec/ui_hierarchy.hpp"
#include "core/logging/logger.hpp"

namespace mobilemcp::devices {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using core::errors::Result;
using protocol::Device;

namespace {

constexpr const char* kDumpPath = "/sdcard/window_dump.xml";
constexpr const char* kDeviceKitPackage = "com.mobilenext.devicekit";
constexpr const char* kDeviceKitReceiver =
    "com.mobilenext.devicekit/.ClipboardBroadcastReceiver";
constexpr std::chrono::milliseconds kDoubleTapGap{50};

std::string pixel(const double value) {
    return std::to_string(static_cast<long long>(std::lround(value)));
}

std::string point_text(const double x, const double y) {
    return "(" + pixel(x) + ", " + pixel(y) + ")";
}

std::string single_quote(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() + 16);
    for (const char c : value) {
        if (c == '\'') {
            escaped += "'\\''";
        } else {
            escaped.push_back(c);
        }
    }
    return "'" + escaped + "'";
}

MobileError invalid_app_id(const std::string& app_id) {
    return MobileError{ErrorCategory::Validation, "Invalid application id: " + app_id,
                       "invalid_app_id", "Use letters, digits, '.', '_' or '-'."};
}

}  // namespace

AndroidDriver::AndroidDriver(const process::CommandRunner& runner,
                             core::config::AdbEndpoint endpoint, const std::uint32_t timeout_ms,
                             const protocol::UiDumpPolicy ui_dump_policy)
    : runner_(runner),
      endpoint_(std::move(endpoint)),
      timeout_ms_(timeout_ms),
      ui_dump_policy_(ui_dump_policy) {}

process::CommandSpec AndroidDriver::command(const Device* device,
                                            std::vector<std::string> args) const {
    process::CommandSpec spec;
    spec.timeout_ms = timeout_ms_;
    spec.argv = {endpoint_.adb_path, "-H", endpoint_.server_host, "-P",
                 std::to_string(endpoint_.server_port)};
    if (device != nullptr) {
        spec.argv.push_back("-s");
        spec.argv.push_back(device->id);
    }
    for (auto& arg : args) {
        spec.argv.push_back(std::move(arg));
    }
    return spec;
}

Result<process::CommandOutput> AndroidDriver::adb(const Device& device,
                                                  std::vector<std::string> args) const {
    const auto spec = command(&device, std::move(args));
    return codec::require_success(spec, runner_.run(spec));
}

Result<process::CommandOutput> AndroidDriver::adb_shell(const Device& device,
                                                        std::vector<std::string> args) const {
    args.insert(args.begin(), "shell");
    return adb(device, std::move(args));
}

Result<std::vector<Device>> AndroidDriver::list_devices() const {
    const auto spec = command(nullptr, {"devices", "-l"});
    auto run = runner_.run(spec);
    if (!core::errors::is_error(run) && core::errors::get_value(run).launch_failed) {
        MOBILEMCP_LOG_DEBUG("adb not found at '" + endpoint_.adb_path + "', no Android devices");
        return std::vector<Device>{};
    }
    auto checked = codec::require_success(spec, run);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    return codec::adb::parse_devices(core::errors::get_value(checked).stdout_text);
}

Result<bool> AndroidDriver::check_ready(const Device& device) const {
    if (device.state != "device") {
        return MobileError{ErrorCategory::Device,
                           "Android device " + device.id + " is " + device.state,
                           "device_not_ready",
                           device.state == "unauthorized"
                               ? "Accept the USB debugging prompt on the device."
                               : ""};
    }
    return true;
}

std::string AndroidDriver::active_display_id(const Device& device) const {
    auto surfaces = adb_shell(device, {"dumpsys", "SurfaceFlinger", "--display-id"});
    if (core::errors::is_error(surfaces) ||
        codec::adb::count_displays(core::errors::get_value(surfaces).stdout_text) <= 1) {
        return "";
    }

    auto displays = adb_shell(device, {"cmd", "display", "get-displays"});
    if (!core::errors::is_error(displays)) {
        auto id = codec::adb::parse_active_display_id(core::errors::get_value(displays).stdout_text);
        if (id) {
            return *id;
        }
    }

    auto legacy = adb_shell(device, {"dumpsys", "display"});
    if (!core::errors::is_error(legacy)) {
        auto id =
            codec::adb::parse_viewport_display_id(core::errors::get_value(legacy).stdout_text);
        if (id) {
            return *id;
        }
    }
    MOBILEMCP_LOG_DEBUG("multiple displays but no active one found, using default display");
    return "";
}

Result<std::string> AndroidDriver::take_screenshot(const Device& device) const {
    std::vector<std::string> args = {"exec-out", "screencap", "-p"};
    const std::string display_id = active_display_id(device);
    if (!display_id.empty()) {
        args.push_back("-d");
        args.push_back(display_id);
    }

    auto output = adb(device, std::move(args));
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    const std::string& bytes = core::errors::get_value(output).stdout_text;
    if (!codec::is_png(bytes)) {
        return MobileError{ErrorCategory::Subprocess,
                           "screencap did not return PNG data (" + std::to_string(bytes.size()) +
                               " bytes)",
                           "invalid_png"};
    }
    return bytes;
}

Result<protocol::ScreenSize> AndroidDriver::get_screen_size(const Device& device) const {
    auto output = adb_shell(device, {"wm", "size"});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return codec::adb::parse_wm_size(core::errors::get_value(output).stdout_text);
}

Result<protocol::Orientation> AndroidDriver::get_orientation(const Device& device) const {
    auto output = adb_shell(device, {"settings", "get", "system", "user_rotation"});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return codec::adb::parse_user_rotation(core::errors::get_value(output).stdout_text);
}

Result<std::vector<protocol::InstalledApp>> AndroidDriver::list_apps(const Device& device) const {
    auto launcher = adb_shell(device, {"cmd", "package", "query-activities", "-a",
                                       "android.intent.action.MAIN", "-c",
                                       "android.intent.category.LAUNCHER"});
    if (!core::errors::is_error(launcher)) {
        auto apps =
            codec::adb::parse_launcher_activities(core::errors::get_value(launcher).stdout_text);
        if (!apps.empty()) {
            return apps;
        }
    } else {
        MOBILEMCP_LOG_DEBUG("query-activities failed: " +
                            core::errors::get_error(launcher).message);
    }

    // Older releases lack query-activities.
    auto packages = adb_shell(device, {"pm", "list", "packages", "-3"});
    if (core::errors::is_error(packages)) {
        return core::errors::get_error(packages);
    }
    return codec::adb::parse_package_list(core::errors::get_value(packages).stdout_text);
}

Result<protocol::ElementListing> AndroidDriver::list_elements(const Device& device,
                                                              const std::string& filter) const {
    auto dumped = adb_shell(device, {"uiautomator", "dump", kDumpPath});
    if (core::errors::is_error(dumped)) {
        return core::errors::get_error(dumped);
    }
    auto xml = adb(device, {"exec-out", "cat", kDumpPath});
    if (core::errors::is_error(xml)) {
        return core::errors::get_error(xml);
    }

    auto parsed = codec::ui::parse_hierarchy(core::errors::get_value(xml).stdout_text,
                                             ui_dump_policy_);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    protocol::ElementListing listing = core::errors::get_value(parsed);
    MOBILEMCP_LOG_DEBUG("ui dump: " + std::to_string(listing.parsed_nodes) + " nodes, " +
                        std::to_string(listing.elements.size()) + " visible");
    listing.elements = codec::ui::filter_elements(listing.elements, filter);
    return listing;
}

Result<std::string> AndroidDriver::tap(const Device& device, const double x,
                                       const double y) const {
    auto output = adb_shell(device, {"input", "tap", pixel(x), pixel(y)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Tapped at " + point_text(x, y);
}

Result<std::string> AndroidDriver::double_tap(const Device& device, const double x,
                                              const double y) const {
    auto first = adb_shell(device, {"input", "tap", pixel(x), pixel(y)});
    if (core::errors::is_error(first)) {
        return core::errors::get_error(first);
    }
    std::this_thread::sleep_for(kDoubleTapGap);
    auto second = adb_shell(device, {"input", "tap", pixel(x), pixel(y)});
    if (core::errors::is_error(second)) {
        return core::errors::get_error(second);
    }
    return "Double tapped at " + point_text(x, y);
}

Result<std::string> AndroidDriver::long_press(const Device& device, const double x,
                                              const double y,
                                              const std::int64_t duration_ms) const {
    // A swipe that does not move is a press held for the swipe duration.
    auto output = adb_shell(device, {"input", "swipe", pixel(x), pixel(y), pixel(x), pixel(y),
                                     std::to_string(duration_ms)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Long pressed at " + point_text(x, y) + " for " + std::to_string(duration_ms) + "ms";
}

Result<std::string> AndroidDriver::swipe(const Device& device, const double start_x,
                                         const double start_y, const double end_x,
                                         const double end_y,
                                         const std::int64_t duration_ms) const {
    auto output = adb_shell(device, {"input", "swipe", pixel(start_x), pixel(start_y),
                                     pixel(end_x), pixel(end_y), std::to_string(duration_ms)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Swiped from " + point_text(start_x, start_y) + " to " + point_text(end_x, end_y) +
           " in " + std::to_string(duration_ms) + "ms";
}

bool AndroidDriver::devicekit_installed(const Device& device) const {
    auto output = adb_shell(device, {"pm", "list", "packages", kDeviceKitPackage});
    if (core::errors::is_error(output)) {
        return false;
    }
    return core::errors::get_value(output).stdout_text.find(std::string("package:") +
                                                            kDeviceKitPackage) !=
           std::string::npos;
}

Result<std::string> AndroidDriver::paste_via_devicekit(const Device& device,
                                                       const std::string& text) const {
    auto set = adb_shell(device, {"am", "broadcast", "-a", "devicekit.clipboard.set", "-e",
                                  "encoding", "base64", "-e", "text",
                                  codec::base64_encode(text), "-n", kDeviceKitReceiver});
    if (core::errors::is_error(set)) {
        return core::errors::get_error(set);
    }
    auto paste = adb_shell(device, {"input", "keyevent", "KEYCODE_PASTE"});
    if (core::errors::is_error(paste)) {
        return core::errors::get_error(paste);
    }
    auto clear = adb_shell(device, {"am", "broadcast", "-a", "devicekit.clipboard.clear", "-n",
                                    kDeviceKitReceiver});
    if (core::errors::is_error(clear)) {
        MOBILEMCP_LOG_WARN("clipboard clear failed: " + core::errors::get_error(clear).message);
    }
    return "Typed " + std::to_string(text.size()) + " bytes via DeviceKit clipboard";
}

Result<std::string> AndroidDriver::type_text(const Device& device, const std::string& text) const {
    if (text.empty()) {
        return std::string("Nothing to type");
    }

    if (!codec::adb::is_ascii(text)) {
        if (!devicekit_installed(device)) {
            return MobileError{ErrorCategory::PlatformUnsupported,
                               "Non-ASCII text input is not supported on this device",
                               "non_ascii_unsupported",
                               std::string("Install ") + kDeviceKitPackage + "."};
        }
        return paste_via_devicekit(device, text);
    }

    const auto chunks = codec::adb::split_chunks(text, codec::adb::kInputTextChunk);
    for (const auto& chunk : chunks) {
        auto output = adb_shell(device, {"input", "text", codec::adb::encode_input_text(chunk)});
        if (core::errors::is_error(output)) {
            return core::errors::get_error(output);
        }
    }
    return "Typed text: " + text;
}

Result<std::string> AndroidDriver::press_button(const Device& device,
                                                const protocol::Button button) const {
    const int keycode = codec::adb::keycode_for(button);
    auto output = adb_shell(device, {"input", "keyevent", std::to_string(keycode)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Pressed " + protocol::to_string(button) + " (keycode " + std::to_string(keycode) + ")";
}

Result<std::string> AndroidDriver::launch_app(const Device& device,
                                              const std::string& app_id) const {
    if (!codec::adb::is_valid_app_id(app_id)) {
        return invalid_app_id(app_id);
    }

    const auto spec = command(&device, {"shell", "monkey", "-p", app_id, "-c",
                                        "android.intent.category.LAUNCHER", "1"});
    auto monkey = runner_.run(spec);
    if (core::errors::is_error(monkey)) {
        return core::errors::get_error(monkey);
    }
    const auto& monkey_output = core::errors::get_value(monkey);
    if (monkey_output.timed_out || monkey_output.launch_failed) {
        return core::errors::get_error(codec::require_success(spec, monkey));
    }
    if (!codec::adb::monkey_failed(monkey_output.exit_code,
                                   monkey_output.stdout_text + monkey_output.stderr_text)) {
        return "Launched " + app_id;
    }

    MOBILEMCP_LOG_DEBUG("monkey could not launch " + app_id + ", resolving launcher activity");
    auto resolved = adb_shell(device, {"cmd", "package", "resolve-activity", "--brief", "-c",
                                       "android.intent.category.LAUNCHER", app_id});
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    auto component =
        codec::adb::parse_resolved_activity(core::errors::get_value(resolved).stdout_text);
    if (!component) {
        return MobileError{ErrorCategory::Subprocess,
                           "No launcher activity found for " + app_id, "launch_failed",
                           "Check that the app is installed (list_apps)."};
    }

    auto started = adb_shell(device, {"am", "start", "-n", *component});
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    const auto& start_output = core::errors::get_value(started);
    if (start_output.stdout_text.find("Error") != std::string::npos) {
        return MobileError{ErrorCategory::Subprocess,
                           "am start failed for " + *component + ": " +
                               codec::diagnostic_text(start_output),
                           "launch_failed"};
    }
    return "Launched " + app_id + " (" + *component + ")";
}

Result<std::string> AndroidDriver::terminate_app(const Device& device,
                                                 const std::string& app_id) const {
    if (!codec::adb::is_valid_app_id(app_id)) {
        return invalid_app_id(app_id);
    }
    auto output = adb_shell(device, {"am", "force-stop", app_id});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Terminated " + app_id;
}

Result<std::string> AndroidDriver::install_app(const Device& device,
                                               const std::string& app_path) const {
    auto spec = command(&device, {"install", "-r", app_path});
    spec.timeout_ms = std::max(timeout_ms_, core::config::kInstallTimeoutFloorMs);
    auto output = codec::require_success(spec, runner_.run(spec));
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    const auto& result = core::errors::get_value(output);
    if (!codec::adb::reports_success(result.stdout_text + result.stderr_text)) {
        return MobileError{ErrorCategory::Subprocess,
                           "adb install failed: " + codec::diagnostic_text(result),
                           "install_failed"};
    }
    return "Installed " + app_path;
}

Result<std::string> AndroidDriver::uninstall_app(const Device& device,
                                                 const std::string& app_id) const {
    if (!codec::adb::is_valid_app_id(app_id)) {
        return invalid_app_id(app_id);
    }
    auto output = adb(device, {"uninstall", app_id});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    const auto& result = core::errors::get_value(output);
    if (!codec::adb::reports_success(result.stdout_text + result.stderr_text)) {
        return MobileError{ErrorCategory::Subprocess,
                           "adb uninstall failed: " + codec::diagnostic_text(result),
                           "uninstall_failed"};
    }
    return "Uninstalled " + app_id;
}

Result<std::string> AndroidDriver::open_url(const Device& device, const std::string& url) const {
    auto output =
        adb_shell(device, {"am", "start", "-a", "android.intent.action.VIEW", "-d",
                           single_quote(url)});
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "Opened " + url;
}

Result<std::string> AndroidDriver::set_orientation(const Device& device,
                                                   const protocol::Orientation orientation) const {
    auto locked = adb_shell(device, {"settings", "put", "system", "accelerometer_rotation", "0"});
    if (core::errors::is_error(locked)) {
        return core::errors::get_error(locked);
    }
    const std::string rotation = orientation == protocol::Orientation::Portrait ? "0" : "1";
    auto rotated = adb_shell(device, {"settings", "put", "system", "user_rotation", rotation});
    if (core::errors::is_error(rotated)) {
        return core::errors::get_error(rotated);
    }
    return "Orientation set to " + protocol::to_string(orientation);
}

}  // namespace mobilemcp::devices
