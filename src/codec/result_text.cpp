#include "codec/result_text.hpp"

#include <sstream>
#include "codec/ui_hierarchy.hpp"

namespace mobilemcp::codec::text {

std::string device_line(const protocol::Device& device) {
    return "- " + device.display_name + " (" + device.id + ") - " +
           protocol::to_string(device.platform) + " " + protocol::to_string(device.kind) +
           " [" + device.state + "]";
}

std::string device_listing(const std::vector<protocol::Device>& devices,
                           const std::vector<std::string>& warnings) {
    std::ostringstream out;
    if (devices.empty()) {
        out << "No devices found";
    }
    for (std::size_t i = 0; i < devices.size(); ++i) {
        out << (i == 0 ? "" : "\n") << device_line(devices[i]);
    }
    for (const auto& warning : warnings) {
        out << "\n" << warning;
    }
    return out.str();
}

std::string screen_size(const protocol::ScreenSize& size, const protocol::Platform platform) {
    std::ostringstream out;
    out << "Screen size: " << size.width << "x" << size.height;
    if (platform == protocol::Platform::Ios) {
        out << " points, scale " << size.scale << "x";
    } else {
        out << " pixels";
    }
    return out.str();
}

std::string orientation(const protocol::Orientation orientation) {
    return "Current orientation: " + protocol::to_string(orientation);
}

std::string app_listing(const std::vector<protocol::InstalledApp>& apps) {
    if (apps.empty()) {
        return "No apps found";
    }
    std::ostringstream out;
    out << "Installed apps:";
    for (const auto& app : apps) {
        out << "\n- " << app.app_name << " (" << app.package_name << ")";
    }
    return out.str();
}

std::string element_listing(const std::vector<protocol::ScreenElement>& elements,
                            const std::string& filter, const bool truncated) {
    std::ostringstream out;
    if (elements.empty()) {
        out << "No elements found";
        if (!filter.empty()) {
            out << " matching \"" << filter << "\"";
        }
    } else {
        out << "Screen elements:";
        for (const auto& element : elements) {
            out << "\n- " << ui::label_for(element) << " at (" << element.bounds.x << ","
                << element.bounds.y << ") size " << element.bounds.width << "x"
                << element.bounds.height << " [type: " << element.class_name << "]";
            if (!element.resource_id.empty()) {
                out << " [id: " << element.resource_id << "]";
            }
            if (element.clickable) {
                out << " [clickable]";
            }
            if (element.focused) {
                out << " [focused]";
            }
        }
    }
    if (truncated) {
        out << "\nNote: the UI dump was truncated; only complete nodes are listed.";
    }
    return out.str();
}

std::string saved_screenshot(const std::string& path, const std::size_t bytes) {
    return "Screenshot saved to: " + path + " (" + std::to_string(bytes) + " bytes)";
}

}  // namespace mobilemcp::codec::text
