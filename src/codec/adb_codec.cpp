#include "codec/adb_codec.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>
#include <system_error>
#include <unordered_set>

namespace mobilemcp::codec::adb {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using protocol::Device;
using protocol::DeviceKind;
using protocol::InstalledApp;
using protocol::Platform;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool starts_with(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

std::vector<std::string> lines_of(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(trim(line));
    }
    return lines;
}

MobileError parse_failure(const std::string& what, const std::string& text) {
    std::string snippet = trim(text);
    if (snippet.size() > 200) {
        snippet = snippet.substr(0, 200) + "...";
    }
    return MobileError{ErrorCategory::Subprocess,
                       "Unexpected " + what + " output: " + (snippet.empty() ? "<empty>" : snippet),
                       "unparsable_output"};
}

std::optional<int> parse_int(const std::string& text) {
    int value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

// "1080x2400" -> {1080, 2400}
std::optional<protocol::ScreenSize> parse_dimensions(const std::string& text) {
    const auto x = text.find('x');
    if (x == std::string::npos) {
        return std::nullopt;
    }
    auto width = parse_int(trim(text.substr(0, x)));
    auto height = parse_int(trim(text.substr(x + 1)));
    if (!width || !height || *width <= 0 || *height <= 0) {
        return std::nullopt;
    }
    return protocol::ScreenSize{*width, *height, 1.0};
}

std::string strip_local_prefix(const std::string& unique_id) {
    if (starts_with(unique_id, "local:")) {
        return unique_id.substr(6);
    }
    return unique_id;
}

}  // namespace

core::errors::Result<std::vector<Device>> parse_devices(const std::string& text) {
    std::vector<Device> devices;
    bool saw_header = false;

    for (const auto& line : lines_of(text)) {
        if (line.empty() || starts_with(line, "*")) {
            continue;  // daemon start-up chatter
        }
        if (starts_with(line, "List of devices attached")) {
            saw_header = true;
            continue;
        }
        if (!saw_header) {
            continue;
        }

        std::istringstream tokens(line);
        std::string serial;
        std::string state;
        tokens >> serial >> state;
        if (serial.empty() || state.empty()) {
            continue;
        }
        if (state == "no") {
            // "no permissions (...)"
            state = "no permissions";
        }

        std::string model;
        std::string token;
        while (tokens >> token) {
            if (starts_with(token, "model:")) {
                model = token.substr(6);
            }
        }
        std::replace(model.begin(), model.end(), '_', ' ');

        Device device;
        device.id = serial;
        device.platform = Platform::Android;
        device.kind = starts_with(serial, "emulator-") ? DeviceKind::Emulator
                                                       : DeviceKind::Physical;
        device.display_name = model.empty() ? "Android device (" + serial + ")" : model;
        device.state = state;
        devices.push_back(std::move(device));
    }

    if (!saw_header) {
        return parse_failure("adb devices", text);
    }
    return devices;
}

core::errors::Result<protocol::ScreenSize> parse_wm_size(const std::string& text) {
    std::optional<protocol::ScreenSize> physical;
    std::optional<protocol::ScreenSize> override_size;

    for (const auto& line : lines_of(text)) {
        if (line.empty()) {
            continue;
        }
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            if (!physical) {
                physical = parse_dimensions(line);
            }
            continue;
        }
        const std::string label = line.substr(0, colon);
        const auto size = parse_dimensions(trim(line.substr(colon + 1)));
        if (label == "Override size") {
            override_size = size;
        } else if (label == "Physical size") {
            physical = size;
        }
    }

    if (override_size) {
        return *override_size;
    }
    if (physical) {
        return *physical;
    }
    return parse_failure("wm size", text);
}

core::errors::Result<protocol::Orientation> parse_user_rotation(const std::string& text) {
    const std::string value = trim(text);
    if (value == "0" || value == "2" || value == "null") {
        return protocol::Orientation::Portrait;
    }
    if (value == "1" || value == "3") {
        return protocol::Orientation::Landscape;
    }
    return parse_failure("user_rotation", text);
}

std::vector<InstalledApp> parse_package_list(const std::string& text) {
    std::vector<InstalledApp> apps;
    for (const auto& line : lines_of(text)) {
        if (!starts_with(line, "package:")) {
            continue;
        }
        const std::string name = line.substr(8);
        if (!name.empty()) {
            apps.push_back(InstalledApp{name, name});
        }
    }
    return apps;
}

std::vector<InstalledApp> parse_launcher_activities(const std::string& text) {
    std::vector<InstalledApp> apps;
    std::unordered_set<std::string> seen;
    for (const auto& line : lines_of(text)) {
        if (!starts_with(line, "packageName=")) {
            continue;
        }
        const std::string name = line.substr(12);
        if (!name.empty() && seen.insert(name).second) {
            apps.push_back(InstalledApp{name, name});
        }
    }
    return apps;
}

std::optional<std::string> parse_resolved_activity(const std::string& text) {
    const auto lines = lines_of(text);
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (it->empty()) {
            continue;
        }
        if (it->find('/') != std::string::npos && it->find(' ') == std::string::npos) {
            return *it;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::size_t count_displays(const std::string& text) {
    std::size_t count = 0;
    for (const auto& line : lines_of(text)) {
        if (starts_with(line, "Display ")) {
            ++count;
        }
    }
    return count;
}

std::optional<std::string> parse_active_display_id(const std::string& text) {
    const std::string marker = "uniqueId \"";
    for (const auto& line : lines_of(text)) {
        if (!starts_with(line, "Display id ") || line.find(", state ON,") == std::string::npos) {
            continue;
        }
        const auto start = line.find(marker);
        if (start == std::string::npos) {
            continue;
        }
        const auto value_start = start + marker.size();
        const auto end = line.find('"', value_start);
        if (end == std::string::npos) {
            continue;
        }
        return strip_local_prefix(line.substr(value_start, end - value_start));
    }
    return std::nullopt;
}

std::optional<std::string> parse_viewport_display_id(const std::string& text) {
    const std::string marker = "uniqueId='";
    for (const auto& line : lines_of(text)) {
        if (line.find("DisplayViewport{type=INTERNAL") == std::string::npos ||
            line.find("isActive=true") == std::string::npos) {
            continue;
        }
        const auto start = line.find(marker);
        if (start == std::string::npos) {
            continue;
        }
        const auto value_start = start + marker.size();
        const auto end = line.find('\'', value_start);
        if (end == std::string::npos) {
            continue;
        }
        return strip_local_prefix(line.substr(value_start, end - value_start));
    }
    return std::nullopt;
}

bool is_valid_app_id(const std::string& app_id) {
    if (app_id.empty()) {
        return false;
    }
    return std::all_of(app_id.begin(), app_id.end(), [](const char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
               c == '.' || c == '_' || c == '-';
    });
}

bool monkey_failed(const int exit_code, const std::string& output) {
    return exit_code != 0 || output.find("No activities found") != std::string::npos ||
           output.find("monkey aborted") != std::string::npos;
}

bool reports_success(const std::string& output) {
    return output.find("Success") != std::string::npos;
}

int keycode_for(const protocol::Button button) {
    using protocol::Button;
    switch (button) {
        case Button::Home: return 3;
        case Button::Back: return 4;
        case Button::Menu: return 82;
        case Button::Power: return 26;
        case Button::VolumeUp: return 24;
        case Button::VolumeDown: return 25;
        case Button::Camera: return 27;
        case Button::Enter: return 66;
        case Button::Search: return 84;
        case Button::AppSwitch: return 187;
        case Button::DpadCenter: return 23;
        case Button::DpadUp: return 19;
        case Button::DpadDown: return 20;
        case Button::DpadLeft: return 21;
        case Button::DpadRight: return 22;
    }
    return 0;
}

bool is_ascii(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
                       [](const char c) { return static_cast<unsigned char>(c) < 0x80; });
}

std::string encode_input_text(const std::string& text) {
    static const std::string kEscaped = "\\'\"`|&;<>()[]{}$*?#~!";
    std::string encoded;
    encoded.reserve(text.size() * 2);
    for (const char c : text) {
        if (c == ' ') {
            encoded += "%s";
        } else if (c == '\t') {
            encoded += "\\t";
        } else if (c == '\n') {
            encoded += "\\n";
        } else if (c == '\r') {
            encoded += "\\r";
        } else if (kEscaped.find(c) != std::string::npos) {
            encoded.push_back('\\');
            encoded.push_back(c);
        } else {
            encoded.push_back(c);
        }
    }
    return encoded;
}

std::vector<std::string> split_chunks(const std::string& text, const std::size_t chunk_size) {
    std::vector<std::string> chunks;
    std::string current;
    for (std::size_t i = 0; i < text.size(); ++i) {
        current.push_back(text[i]);
        // `input text` turns every "%s" into a space; a literal one must span two calls.
        const bool literal_percent_s = text[i] == '%' && i + 1 < text.size() && text[i + 1] == 's';
        if ((chunk_size > 0 && current.size() == chunk_size) || literal_percent_s) {
            chunks.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        chunks.push_back(std::move(current));
    }
    return chunks;
}

}  // namespace mobilemcp::codec::adb
