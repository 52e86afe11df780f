#pragma once

#include <string>
#include <vector>
#include "core/errors/mobile_errors.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::codec::simctl {

// `xcrun simctl list devices available --json`.
core::errors::Result<std::vector<protocol::Device>> parse_devices_json(const std::string& text);

// "com.apple.CoreSimulator.SimRuntime.iOS-17-0" -> "iOS 17.0"
std::string runtime_label(const std::string& runtime_key);

// `idevice_id -l`: one UDID per line.
std::vector<protocol::Device> parse_idevice_ids(const std::string& text);

// `xcrun simctl listapps <udid>`: JSON object or the NeXTSTEP plist simctl prints by default.
core::errors::Result<std::vector<protocol::InstalledApp>> parse_listapps(const std::string& text);

// Logical screen size by model name; simctl has no query for it.
protocol::ScreenSize screen_size_for_model(const std::string& model_name);

}  // namespace mobilemcp::codec::simctl
