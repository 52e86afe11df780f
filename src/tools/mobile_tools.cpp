#include "tools/mobile_tools.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "codec/content.hpp"
#include "codec/result_text.hpp"

namespace mobilemcp::tools {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using core::errors::Result;
using devices::DeviceManager;
using devices::DeviceRef;
using nlohmann::json;
using protocol::Device;
using protocol::ToolResult;

namespace {

// 1. Schema building blocks

json platform_property() {
    return json{{"type", "string"},
                {"enum", json::array({"android", "ios", "auto"})},
                {"description",
                 "Target platform. 'auto' searches Android devices first, then iOS."}};
}

json device_id_property() {
    return json{{"type", "string"},
                {"description",
                 "Device identifier as shown by list_available_devices (adb serial or UDID)."}};
}

// Upper bounds keep values convertible to the integers handed to adb and simctl.
constexpr int kMaxCoordinate = 100000;
constexpr int kMaxGestureDurationMs = 60000;

json coordinate_property(const std::string& description) {
    return json{{"type", "number"},
                {"minimum", 0},
                {"maximum", kMaxCoordinate},
                {"description", description}};
}

json duration_property(const int default_ms, const std::string& description) {
    return json{{"type", "integer"},
                {"minimum", 0},
                {"maximum", kMaxGestureDurationMs},
                {"default", default_ms},
                {"description", description}};
}

json string_property(const std::string& description) {
    return json{{"type", "string"}, {"description", description}};
}

// Every tool but discovery targets one device.
json device_schema(json extra_properties = json::object(),
                   std::vector<std::string> extra_required = {}) {
    json properties = {{"device_id", device_id_property()}, {"platform", platform_property()}};
    for (auto& [name, property] : extra_properties.items()) {
        properties[name] = property;
    }
    json required = json::array({"device_id"});
    for (auto& name : extra_required) {
        required.push_back(std::move(name));
    }
    return json{{"type", "object"}, {"properties", properties}, {"required", required}};
}

json button_names_json() {
    json names = json::array();
    for (const auto& entry : protocol::button_names()) {
        names.push_back(entry.name);
    }
    return names;
}

// 2. Argument extraction (arguments are already validated)

class Args {
public:
    Args(const json& arguments, const protocol::PlatformSelector default_platform)
        : arguments_(arguments), default_platform_(default_platform) {}

    protocol::PlatformSelector platform() const {
        if (!arguments_.contains("platform")) {
            return default_platform_;
        }
        auto selector =
            protocol::parse_platform_selector(arguments_.at("platform").get<std::string>());
        return selector ? *selector : default_platform_;
    }

    DeviceRef device() const { return DeviceRef{platform(), text("device_id")}; }

    std::string text(const char* name) const {
        return arguments_.contains(name) ? arguments_.at(name).get<std::string>() : "";
    }

    double number(const char* name) const { return arguments_.at(name).get<double>(); }

    std::int64_t integer(const char* name) const {
        return arguments_.at(name).get<std::int64_t>();
    }

private:
    const json& arguments_;
    protocol::PlatformSelector default_platform_;
};

Result<ToolResult> as_text(const Result<std::string>& message) {
    if (core::errors::is_error(message)) {
        return core::errors::get_error(message);
    }
    return codec::text_result(core::errors::get_value(message));
}

}  // namespace

core::errors::Result<bool> register_mobile_tools(ToolRegistry& registry,
                                                 const DeviceManager& manager,
                                                 const codec::ArtifactWriter& writer,
                                                 const protocol::PlatformSelector default_platform) {
    const DeviceManager* devices = &manager;
    const codec::ArtifactWriter* files = &writer;
    const auto platform_default = default_platform;
    std::vector<ToolDefinition> definitions;

    // 3. Device information

    definitions.push_back(ToolDefinition{
        "list_available_devices",
        "List connected Android devices and emulators and iOS simulators and devices.",
        json{{"type", "object"},
             {"properties", {{"platform", platform_property()}}},
             {"required", json::array()}},
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const auto report = devices->list_devices(args.platform());
            return codec::text_result(
                codec::text::device_listing(report.devices, report.warnings));
        }});

    definitions.push_back(ToolDefinition{
        "get_screen_size",
        "Get the screen size of a device: pixels on Android, points and scale on iOS.",
        device_schema(),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            return as_text(devices->route<std::string>(
                args.device(), "get_screen_size",
                [](const auto& driver, const Device& device) -> Result<std::string> {
                    auto size = driver.get_screen_size(device);
                    if (core::errors::is_error(size)) {
                        return core::errors::get_error(size);
                    }
                    return codec::text::screen_size(core::errors::get_value(size),
                                                    device.platform);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "get_orientation", "Get the current screen orientation (portrait or landscape).",
        device_schema(),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            return as_text(devices->route<std::string>(
                args.device(), "get_orientation",
                [](const auto& driver, const Device& device) -> Result<std::string> {
                    auto orientation = driver.get_orientation(device);
                    if (core::errors::is_error(orientation)) {
                        return core::errors::get_error(orientation);
                    }
                    return codec::text::orientation(core::errors::get_value(orientation));
                }));
        }});

    definitions.push_back(ToolDefinition{
        "list_apps", "List the launchable apps installed on a device.",
        device_schema(),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            return as_text(devices->route<std::string>(
                args.device(), "list_apps",
                [](const auto& driver, const Device& device) -> Result<std::string> {
                    auto apps = driver.list_apps(device);
                    if (core::errors::is_error(apps)) {
                        return core::errors::get_error(apps);
                    }
                    return codec::text::app_listing(core::errors::get_value(apps));
                }));
        }});

    definitions.push_back(ToolDefinition{
        "list_elements_on_screen",
        "List visible UI elements with their text, bounds and resource ids (Android). "
        "An optional filter keeps elements whose text, description, id or class contains it.",
        device_schema({{"filter", string_property("Case-insensitive substring to match.")}}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string filter = args.text("filter");
            return as_text(devices->route<std::string>(
                args.device(), "list_elements_on_screen",
                [&filter](const auto& driver, const Device& device) -> Result<std::string> {
                    auto listing = driver.list_elements(device, filter);
                    if (core::errors::is_error(listing)) {
                        return core::errors::get_error(listing);
                    }
                    const auto& value = core::errors::get_value(listing);
                    return codec::text::element_listing(value.elements, filter, value.truncated);
                }));
        }});

    // 4. Screen interaction

    definitions.push_back(ToolDefinition{
        "take_screenshot", "Capture the device screen and return it as a PNG image.",
        device_schema(),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            auto png = devices->route<std::string>(
                args.device(), "take_screenshot",
                [](const auto& driver, const Device& device) {
                    return driver.take_screenshot(device);
                });
            if (core::errors::is_error(png)) {
                return core::errors::get_error(png);
            }
            ToolResult result;
            result.content.push_back(codec::png_block(core::errors::get_value(png)));
            return result;
        }});

    definitions.push_back(ToolDefinition{
        "save_screenshot", "Capture the device screen and write the PNG to a local file.",
        device_schema({{"output_path",
                        string_property("File to write; missing directories are created.")}},
                      {"output_path"}),
        [devices, files, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string output_path = args.text("output_path");
            if (output_path.empty()) {
                return MobileError{ErrorCategory::Validation, "output_path cannot be empty.",
                                   "invalid_output_path"};
            }
            auto png = devices->route<std::string>(
                args.device(), "save_screenshot",
                [](const auto& driver, const Device& device) {
                    return driver.take_screenshot(device);
                });
            if (core::errors::is_error(png)) {
                return core::errors::get_error(png);
            }
            const std::string& bytes = core::errors::get_value(png);
            auto written = files->write_bytes(output_path, bytes);
            if (core::errors::is_error(written)) {
                return core::errors::get_error(written);
            }
            return codec::text_result(codec::text::saved_screenshot(
                core::errors::get_value(written).string(), bytes.size()));
        }});

    definitions.push_back(ToolDefinition{
        "click_on_screen_at_coordinates", "Tap the screen at the given coordinates.",
        device_schema({{"x", coordinate_property("Horizontal coordinate.")},
                       {"y", coordinate_property("Vertical coordinate.")}},
                      {"x", "y"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const double x = args.number("x");
            const double y = args.number("y");
            return as_text(devices->route<std::string>(
                args.device(), "click_on_screen_at_coordinates",
                [x, y](const auto& driver, const Device& device) {
                    return driver.tap(device, x, y);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "double_tap_on_screen", "Tap twice in quick succession at the given coordinates.",
        device_schema({{"x", coordinate_property("Horizontal coordinate.")},
                       {"y", coordinate_property("Vertical coordinate.")}},
                      {"x", "y"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const double x = args.number("x");
            const double y = args.number("y");
            return as_text(devices->route<std::string>(
                args.device(), "double_tap_on_screen",
                [x, y](const auto& driver, const Device& device) {
                    return driver.double_tap(device, x, y);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "long_press_on_screen_at_coordinates",
        "Press and hold at the given coordinates. iOS simulators perform a plain tap.",
        device_schema({{"x", coordinate_property("Horizontal coordinate.")},
                       {"y", coordinate_property("Vertical coordinate.")},
                       {"duration", duration_property(1000, "Hold time in milliseconds.")}},
                      {"x", "y"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const double x = args.number("x");
            const double y = args.number("y");
            const std::int64_t duration = args.integer("duration");
            return as_text(devices->route<std::string>(
                args.device(), "long_press_on_screen_at_coordinates",
                [x, y, duration](const auto& driver, const Device& device) {
                    return driver.long_press(device, x, y, duration);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "swipe_on_screen", "Swipe from one point to another.",
        device_schema({{"start_x", coordinate_property("Start horizontal coordinate.")},
                       {"start_y", coordinate_property("Start vertical coordinate.")},
                       {"end_x", coordinate_property("End horizontal coordinate.")},
                       {"end_y", coordinate_property("End vertical coordinate.")},
                       {"duration",
                        duration_property(300, "Swipe duration in milliseconds (Android).")}},
                      {"start_x", "start_y", "end_x", "end_y"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const double start_x = args.number("start_x");
            const double start_y = args.number("start_y");
            const double end_x = args.number("end_x");
            const double end_y = args.number("end_y");
            const std::int64_t duration = args.integer("duration");
            return as_text(devices->route<std::string>(
                args.device(), "swipe_on_screen",
                [=](const auto& driver, const Device& device) {
                    return driver.swipe(device, start_x, start_y, end_x, end_y, duration);
                }));
        }});

    // 5. Input

    definitions.push_back(ToolDefinition{
        "type_keys", "Type text into the focused field.",
        device_schema({{"text", string_property("Text to type.")}}, {"text"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string text = args.text("text");
            return as_text(devices->route<std::string>(
                args.device(), "type_keys", [&text](const auto& driver, const Device& device) {
                    return driver.type_text(device, text);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "press_button", "Press a hardware or navigation button.",
        device_schema({{"button",
                        {{"type", "string"},
                         {"enum", button_names_json()},
                         {"description", "Button name."}}}},
                      {"button"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const auto button = protocol::parse_button(args.text("button"));
            if (!button) {
                return MobileError{ErrorCategory::Validation,
                                   "Unknown button: " + args.text("button"), "unknown_button"};
            }
            const protocol::Button pressed = *button;
            return as_text(devices->route<std::string>(
                args.device(), "press_button", [pressed](const auto& driver, const Device& device) {
                    return driver.press_button(device, pressed);
                }));
        }});

    // 6. App management

    definitions.push_back(ToolDefinition{
        "launch_app", "Launch an app by package name (Android) or bundle id (iOS).",
        device_schema({{"app_id", string_property("Package name or bundle identifier.")}},
                      {"app_id"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string app_id = args.text("app_id");
            return as_text(devices->route<std::string>(
                args.device(), "launch_app", [&app_id](const auto& driver, const Device& device) {
                    return driver.launch_app(device, app_id);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "terminate_app", "Force-stop a running app.",
        device_schema({{"app_id", string_property("Package name or bundle identifier.")}},
                      {"app_id"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string app_id = args.text("app_id");
            return as_text(devices->route<std::string>(
                args.device(), "terminate_app",
                [&app_id](const auto& driver, const Device& device) {
                    return driver.terminate_app(device, app_id);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "install_app", "Install an app from a local .apk (Android) or .app bundle (iOS).",
        device_schema({{"app_path", string_property("Local path of the package to install.")}},
                      {"app_path"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string app_path = args.text("app_path");
            return as_text(devices->route<std::string>(
                args.device(), "install_app",
                [&app_path](const auto& driver, const Device& device) {
                    return driver.install_app(device, app_path);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "uninstall_app", "Remove an installed app.",
        device_schema({{"app_id", string_property("Package name or bundle identifier.")}},
                      {"app_id"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string app_id = args.text("app_id");
            return as_text(devices->route<std::string>(
                args.device(), "uninstall_app",
                [&app_id](const auto& driver, const Device& device) {
                    return driver.uninstall_app(device, app_id);
                }));
        }});

    // 7. Navigation

    definitions.push_back(ToolDefinition{
        "open_url", "Open a URL in the default handler on the device.",
        device_schema({{"url", string_property("URL to open.")}}, {"url"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const std::string url = args.text("url");
            return as_text(devices->route<std::string>(
                args.device(), "open_url", [&url](const auto& driver, const Device& device) {
                    return driver.open_url(device, url);
                }));
        }});

    definitions.push_back(ToolDefinition{
        "set_orientation", "Rotate the screen to portrait or landscape.",
        device_schema({{"orientation",
                        {{"type", "string"},
                         {"enum", json::array({"portrait", "landscape"})},
                         {"description", "Target orientation."}}}},
                      {"orientation"}),
        [devices, platform_default](const json& arguments) -> Result<ToolResult> {
            const Args args(arguments, platform_default);
            const auto orientation = protocol::parse_orientation(args.text("orientation"));
            if (!orientation) {
                return MobileError{ErrorCategory::Validation,
                                   "Unknown orientation: " + args.text("orientation"),
                                   "invalid_orientation"};
            }
            const protocol::Orientation target = *orientation;
            return as_text(devices->route<std::string>(
                args.device(), "set_orientation",
                [target](const auto& driver, const Device& device) {
                    return driver.set_orientation(device, target);
                }));
        }});

    for (auto& definition : definitions) {
        auto registered = registry.register_tool(std::move(definition));
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
    }
    return true;
}

}  // namespace mobilemcp::tools
