#include "devices/device_manager.hpp"

#include <optional>

namespace mobilemcp::devices {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using protocol::Device;
using protocol::PlatformSelector;

namespace {

std::optional<Device> find_device(const std::vector<Device>& devices, const std::string& id) {
    for (const auto& device : devices) {
        if (device.id == id) {
            return device;
        }
    }
    return std::nullopt;
}

std::string discovery_warning(const protocol::Platform platform, const MobileError& error) {
    return "Warning: " + protocol::to_string(platform) + " discovery failed: " + error.message;
}

MobileError not_found(const std::string& id, const std::string& hint) {
    return MobileError{ErrorCategory::Device, "Device not found: " + id, "device_not_found",
                       hint.empty() ? "Call list_available_devices to see connected devices."
                                    : hint};
}

}  // namespace

std::string to_string(const CallState state) {
    switch (state) {
        case CallState::Resolving: return "resolving";
        case CallState::Dispatched: return "dispatched";
        case CallState::Succeeded: return "succeeded";
        case CallState::Failed: return "failed";
    }
    return "unknown";
}

DeviceManager::DeviceManager(const AndroidDriver& android, const IosDriver& ios)
    : android_(android), ios_(ios) {}

void DeviceManager::log_state(const std::string& operation, const std::string& device_id,
                              const CallState state) const {
    MOBILEMCP_LOG_DEBUG(operation + " [" + device_id + "]: " + to_string(state));
}

DiscoveryReport DeviceManager::list_devices(const PlatformSelector selector) const {
    DiscoveryReport report;

    if (selector != PlatformSelector::Ios) {
        auto android = android_.list_devices();
        if (core::errors::is_error(android)) {
            const auto& err = core::errors::get_error(android);
            MOBILEMCP_LOG_WARN("Android discovery failed [" + err.code + "]: " + err.message);
            report.warnings.push_back(discovery_warning(protocol::Platform::Android, err));
        } else {
            const auto& found = core::errors::get_value(android);
            report.devices.insert(report.devices.end(), found.begin(), found.end());
        }
    }

    if (selector != PlatformSelector::Android) {
        auto ios = ios_.list_devices();
        if (core::errors::is_error(ios)) {
            const auto& err = core::errors::get_error(ios);
            MOBILEMCP_LOG_WARN("iOS discovery failed [" + err.code + "]: " + err.message);
            report.warnings.push_back(discovery_warning(protocol::Platform::Ios, err));
        } else {
            const auto& found = core::errors::get_value(ios);
            report.devices.insert(report.devices.end(), found.begin(), found.end());
        }
    }

    return report;
}

core::errors::Result<DriverTarget> DeviceManager::resolve(const DeviceRef& ref) const {
    if (ref.device_id.empty()) {
        return MobileError{ErrorCategory::Validation, "device_id cannot be empty.",
                           "missing_device_id"};
    }

    std::optional<Device> android_match;
    std::optional<Device> ios_match;
    std::string discovery_errors;

    if (ref.selector != PlatformSelector::Ios) {
        auto android = android_.list_devices();
        if (core::errors::is_error(android)) {
            const auto& err = core::errors::get_error(android);
            if (ref.selector == PlatformSelector::Android) {
                return err;
            }
            discovery_errors += discovery_warning(protocol::Platform::Android, err);
        } else {
            android_match = find_device(core::errors::get_value(android), ref.device_id);
        }
    }

    if (ref.selector != PlatformSelector::Android) {
        auto ios = ios_.list_devices();
        if (core::errors::is_error(ios)) {
            const auto& err = core::errors::get_error(ios);
            if (ref.selector == PlatformSelector::Ios) {
                return err;
            }
            if (!discovery_errors.empty()) {
                discovery_errors += "; ";
            }
            discovery_errors += discovery_warning(protocol::Platform::Ios, err);
        } else {
            ios_match = find_device(core::errors::get_value(ios), ref.device_id);
        }
    }

    if (android_match && ios_match) {
        return MobileError{ErrorCategory::Device,
                           "Device id " + ref.device_id +
                               " matches both an Android and an iOS device",
                           "ambiguous_device", "Pass platform \"android\" or \"ios\"."};
    }
    if (android_match) {
        return DriverTarget{AndroidTarget{&android_, *android_match}};
    }
    if (ios_match) {
        return DriverTarget{IosTarget{&ios_, *ios_match}};
    }
    return not_found(ref.device_id, discovery_errors);
}

}  // namespace mobilemcp::devices
