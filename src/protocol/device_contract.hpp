#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace mobilemcp::protocol {

enum class Platform {
    Android,
    Ios
};

// What a caller asked for; Auto lets the device manager decide.
enum class PlatformSelector {
    Android,
    Ios,
    Auto
};

enum class DeviceKind {
    Physical,
    Emulator,
    Simulator
};

struct Device {
    std::string id;
    std::string display_name;
    Platform platform = Platform::Android;
    DeviceKind kind = DeviceKind::Physical;
    std::string state;
    std::string model;  // hardware model without runtime or OS suffix, when known
};

struct ScreenSize {
    int width = 0;
    int height = 0;
    double scale = 1.0;
};

enum class Orientation {
    Portrait,
    Landscape
};

enum class Button {
    Home,
    Back,
    Menu,
    Power,
    VolumeUp,
    VolumeDown,
    Camera,
    Enter,
    Search,
    AppSwitch,
    DpadCenter,
    DpadUp,
    DpadDown,
    DpadLeft,
    DpadRight
};

struct InstalledApp {
    std::string package_name;
    std::string app_name;
};

struct ElementBounds {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;
};

struct ScreenElement {
    std::string class_name;
    std::string text;
    std::string content_desc;
    std::string resource_id;
    ElementBounds bounds;
    bool clickable = false;
    bool focused = false;
};

// How a truncated or malformed UI hierarchy dump is treated.
enum class UiDumpPolicy {
    Strict,   // any structural damage fails the call
    Partial   // keep the nodes that were complete before the damage
};

struct ElementListing {
    std::vector<ScreenElement> elements;
    std::size_t parsed_nodes = 0;
    bool truncated = false;
};

inline std::string to_string(const Platform platform) {
    switch (platform) {
        case Platform::Android:
            return "android";
        case Platform::Ios:
            return "ios";
        default:
            return "unknown";
    }
}

inline std::string to_string(const PlatformSelector selector) {
    switch (selector) {
        case PlatformSelector::Android:
            return "android";
        case PlatformSelector::Ios:
            return "ios";
        case PlatformSelector::Auto:
            return "auto";
        default:
            return "unknown";
    }
}

inline std::string to_string(const DeviceKind kind) {
    switch (kind) {
        case DeviceKind::Physical:
            return "physical";
        case DeviceKind::Emulator:
            return "emulator";
        case DeviceKind::Simulator:
            return "simulator";
        default:
            return "unknown";
    }
}

inline std::string to_string(const Orientation orientation) {
    switch (orientation) {
        case Orientation::Portrait:
            return "portrait";
        case Orientation::Landscape:
            return "landscape";
        default:
            return "unknown";
    }
}

inline std::string to_string(const UiDumpPolicy policy) {
    switch (policy) {
        case UiDumpPolicy::Strict:
            return "strict";
        case UiDumpPolicy::Partial:
            return "partial";
        default:
            return "unknown";
    }
}

inline std::optional<PlatformSelector> parse_platform_selector(const std::string& value) {
    if (value == "android") {
        return PlatformSelector::Android;
    }
    if (value == "ios") {
        return PlatformSelector::Ios;
    }
    if (value == "auto") {
        return PlatformSelector::Auto;
    }
    return std::nullopt;
}

inline std::optional<Orientation> parse_orientation(const std::string& value) {
    if (value == "portrait") {
        return Orientation::Portrait;
    }
    if (value == "landscape") {
        return Orientation::Landscape;
    }
    return std::nullopt;
}

inline std::optional<UiDumpPolicy> parse_ui_dump_policy(const std::string& value) {
    if (value == "strict") {
        return UiDumpPolicy::Strict;
    }
    if (value == "partial") {
        return UiDumpPolicy::Partial;
    }
    return std::nullopt;
}

struct ButtonName {
    const char* name;
    Button button;
};

inline const std::vector<ButtonName>& button_names() {
    static const std::vector<ButtonName> kNames = {
        {"home", Button::Home},
        {"back", Button::Back},
        {"menu", Button::Menu},
        {"power", Button::Power},
        {"volume_up", Button::VolumeUp},
        {"volume_down", Button::VolumeDown},
        {"camera", Button::Camera},
        {"enter", Button::Enter},
        {"search", Button::Search},
        {"app_switch", Button::AppSwitch},
        {"dpad_center", Button::DpadCenter},
        {"dpad_up", Button::DpadUp},
        {"dpad_down", Button::DpadDown},
        {"dpad_left", Button::DpadLeft},
        {"dpad_right", Button::DpadRight}};
    return kNames;
}

inline std::optional<Button> parse_button(const std::string& value) {
    for (const auto& entry : button_names()) {
        if (value == entry.name) {
            return entry.button;
        }
    }
    return std::nullopt;
}

inline std::string to_string(const Button button) {
    for (const auto& entry : button_names()) {
        if (entry.button == button) {
            return entry.name;
        }
    }
    return "unknown";
}

}  // namespace mobilemcp::protocol
