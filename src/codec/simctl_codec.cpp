#include "codec/simctl_codec.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <sstream>
#include <nlohmann/json.hpp>

namespace mobilemcp::codec::simctl {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using nlohmann::json;
using protocol::Device;
using protocol::InstalledApp;

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string unquote(const std::string& value) {
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string string_field(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

struct PlistApp {
    std::string display_name;
    std::string bundle_name;
};

// Walks the top-level dictionary of an old-style plist:
//   "com.example.app" = { CFBundleDisplayName = Example; ... };
core::errors::Result<std::vector<InstalledApp>> parse_listapps_plist(const std::string& text) {
    std::map<std::string, PlistApp> apps;
    std::istringstream in(text);
    std::string line;
    int depth = 0;
    std::string current;
    bool saw_root = false;

    while (std::getline(in, line)) {
        const std::string trimmed = trim(line);
        if (trimmed.empty()) {
            continue;
        }

        if (depth == 1) {
            const auto eq = trimmed.find('=');
            if (eq != std::string::npos && trimmed.back() == '{') {
                current = unquote(trim(trimmed.substr(0, eq)));
                apps[current];
            }
        } else if (depth == 2 && !current.empty()) {
            const auto eq = trimmed.find('=');
            if (eq != std::string::npos && trimmed.back() == ';') {
                const std::string key = trim(trimmed.substr(0, eq));
                const std::string value =
                    unquote(trim(trimmed.substr(eq + 1, trimmed.size() - eq - 2)));
                if (key == "CFBundleDisplayName") {
                    apps[current].display_name = value;
                } else if (key == "CFBundleName") {
                    apps[current].bundle_name = value;
                }
            }
        }

        bool in_quotes = false;
        for (const char c : trimmed) {
            if (c == '"') {
                in_quotes = !in_quotes;
            } else if (!in_quotes && c == '{') {
                ++depth;
                saw_root = true;
            } else if (!in_quotes && c == '}') {
                --depth;
                if (depth == 1) {
                    current.clear();
                }
            }
        }
    }

    if (!saw_root || depth != 0) {
        return MobileError{ErrorCategory::Subprocess, "Unexpected simctl listapps output.",
                           "unparsable_output"};
    }

    std::vector<InstalledApp> result;
    for (const auto& [bundle_id, info] : apps) {
        std::string name = info.display_name;
        if (name.empty()) {
            name = info.bundle_name.empty() ? bundle_id : info.bundle_name;
        }
        result.push_back(InstalledApp{bundle_id, name});
    }
    return result;
}

}  // namespace

std::string runtime_label(const std::string& runtime_key) {
    const auto dot = runtime_key.rfind('.');
    std::string tail = dot == std::string::npos ? runtime_key : runtime_key.substr(dot + 1);
    const auto dash = tail.find('-');
    if (dash == std::string::npos) {
        return tail;
    }
    std::string version = tail.substr(dash + 1);
    std::replace(version.begin(), version.end(), '-', '.');
    return tail.substr(0, dash) + " " + version;
}

core::errors::Result<std::vector<Device>> parse_devices_json(const std::string& text) {
    const json payload = json::parse(text, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        return MobileError{ErrorCategory::Subprocess, "simctl did not return valid JSON.",
                           "unparsable_output"};
    }
    const auto devices_it = payload.find("devices");
    if (devices_it == payload.end() || !devices_it->is_object()) {
        return MobileError{ErrorCategory::Subprocess,
                           "simctl JSON has no \"devices\" object.", "unparsable_output"};
    }

    std::vector<Device> devices;
    for (const auto& [runtime, list] : devices_it->items()) {
        if (!list.is_array()) {
            continue;
        }
        const std::string label = runtime_label(runtime);
        for (const auto& entry : list) {
            if (!entry.is_object()) {
                continue;
            }
            const std::string udid = string_field(entry, "udid");
            const std::string name = string_field(entry, "name");
            const std::string state = string_field(entry, "state");
            if (udid.empty() || name.empty()) {
                continue;
            }

            Device device;
            device.id = udid;
            device.display_name = label.empty() ? name : name + " (" + label + ")";
            device.model = name;
            device.platform = protocol::Platform::Ios;
            device.kind = protocol::DeviceKind::Simulator;
            device.state = to_lower(state);
            devices.push_back(std::move(device));
        }
    }
    return devices;
}

std::vector<Device> parse_idevice_ids(const std::string& text) {
    std::vector<Device> devices;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        const std::string udid = trim(line);
        if (udid.empty()) {
            continue;
        }
        Device device;
        device.id = udid;
        device.display_name = "iOS device (" + udid.substr(0, 8) + ")";
        device.platform = protocol::Platform::Ios;
        device.kind = protocol::DeviceKind::Physical;
        device.state = "connected";
        devices.push_back(std::move(device));
    }
    return devices;
}

core::errors::Result<std::vector<InstalledApp>> parse_listapps(const std::string& text) {
    const json payload = json::parse(text, nullptr, false);
    if (!payload.is_discarded()) {
        if (!payload.is_object()) {
            return MobileError{ErrorCategory::Subprocess,
                               "simctl listapps JSON is not an object.", "unparsable_output"};
        }
        std::vector<InstalledApp> apps;
        for (const auto& [bundle_id, info] : payload.items()) {
            std::string name;
            if (info.is_object()) {
                name = string_field(info, "CFBundleDisplayName");
                if (name.empty()) {
                    name = string_field(info, "CFBundleName");
                }
            }
            apps.push_back(InstalledApp{bundle_id, name.empty() ? bundle_id : name});
        }
        return apps;
    }
    return parse_listapps_plist(text);
}

protocol::ScreenSize screen_size_for_model(const std::string& model_name) {
    const auto has = [&model_name](const char* needle) {
        return model_name.find(needle) != std::string::npos;
    };

    if (has("Pro Max")) {
        return {430, 932, 3.0};
    }
    if (has("iPhone 15") || has("iPhone 14") || has("iPhone 13")) {
        return {390, 844, 3.0};
    }
    if (has("iPhone SE")) {
        return {375, 667, 2.0};
    }
    if (has("iPad Pro") && has("12.9")) {
        return {1024, 1366, 2.0};
    }
    if ((has("iPad Pro") && has("11")) || has("iPad Air")) {
        return {834, 1194, 2.0};
    }
    if (has("iPad")) {
        return {810, 1080, 2.0};
    }
    return {390, 844, 3.0};
}

}  // namespace mobilemcp::codec::simctl
