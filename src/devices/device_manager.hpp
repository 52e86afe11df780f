#pragma once

#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include "core/errors/mobile_errors.hpp"
#include "core/logging/logger.hpp"
#include "devices/android_driver.hpp"
#include "devices/ios_driver.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::devices {

struct DeviceRef {
    protocol::PlatformSelector selector = protocol::PlatformSelector::Auto;
    std::string device_id;
};

struct DiscoveryReport {
    std::vector<protocol::Device> devices;
    std::vector<std::string> warnings;  // one per platform whose discovery failed
};

struct AndroidTarget {
    const AndroidDriver* driver;
    protocol::Device device;
};

struct IosTarget {
    const IosDriver* driver;
    protocol::Device device;
};

// Closed set of platforms; dispatch goes through std::visit, never through string compares.
using DriverTarget = std::variant<AndroidTarget, IosTarget>;

enum class CallState {
    Resolving,
    Dispatched,
    Succeeded,
    Failed
};

std::string to_string(CallState state);

class DeviceManager {
public:
    DeviceManager(const AndroidDriver& android, const IosDriver& ios);

    // Android first, then iOS. A failing platform becomes a warning, not an error.
    DiscoveryReport list_devices(protocol::PlatformSelector selector) const;

    core::errors::Result<DriverTarget> resolve(const DeviceRef& ref) const;

    // Resolves `ref`, checks the device can be driven, then calls
    // op(driver, device) on the matching driver. op must accept both driver types.
    template <typename T, typename Op>
    core::errors::Result<T> route(const DeviceRef& ref, const std::string& operation,
                                  Op&& op) const {
        log_state(operation, ref.device_id, CallState::Resolving);
        auto target = resolve(ref);
        if (core::errors::is_error(target)) {
            log_state(operation, ref.device_id, CallState::Failed);
            return core::errors::get_error(target);
        }

        log_state(operation, ref.device_id, CallState::Dispatched);
        core::errors::Result<T> result = std::visit(
            [&op](const auto& resolved) -> core::errors::Result<T> {
                auto ready = resolved.driver->check_ready(resolved.device);
                if (core::errors::is_error(ready)) {
                    return core::errors::get_error(ready);
                }
                return op(*resolved.driver, resolved.device);
            },
            core::errors::get_value(target));

        log_state(operation, ref.device_id,
                  core::errors::is_error(result) ? CallState::Failed : CallState::Succeeded);
        return result;
    }

private:
    void log_state(const std::string& operation, const std::string& device_id,
                   CallState state) const;

    const AndroidDriver& android_;
    const IosDriver& ios_;
};

}  // namespace mobilemcp::devices
