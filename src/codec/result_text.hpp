#pragma once

#include <string>
#include <vector>
#include "protocol/device_contract.hpp"

namespace mobilemcp::codec::text {

std::string device_line(const protocol::Device& device);

// "No devices found" when both lists are empty.
std::string device_listing(const std::vector<protocol::Device>& devices,
                           const std::vector<std::string>& warnings);

std::string screen_size(const protocol::ScreenSize& size, protocol::Platform platform);

std::string orientation(protocol::Orientation orientation);

std::string app_listing(const std::vector<protocol::InstalledApp>& apps);

std::string element_listing(const std::vector<protocol::ScreenElement>& elements,
                            const std::string& filter, bool truncated);

std::string saved_screenshot(const std::string& path, std::size_t bytes);

}  // namespace mobilemcp::codec::text
