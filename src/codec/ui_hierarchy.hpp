#pragma once

#include <optional>
#include <string>
#include <vector>
#include "core/errors/mobile_errors.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::codec::ui {

// Parses a `uiautomator dump` document. Nodes with zero area are dropped.
// A dump cut off before </hierarchy> fails under Strict and keeps the complete
// nodes under Partial (listing.truncated is then set).
core::errors::Result<protocol::ElementListing> parse_hierarchy(const std::string& xml,
                                                               protocol::UiDumpPolicy policy);

// "[x1,y1][x2,y2]" -> {x1, y1, x2 - x1, y2 - y1}
std::optional<protocol::ElementBounds> parse_bounds(const std::string& bounds);

std::string decode_entities(const std::string& value);

// Case-insensitive substring match on text, content-desc, resource-id and class.
std::vector<protocol::ScreenElement> filter_elements(
    const std::vector<protocol::ScreenElement>& elements, const std::string& filter);

// Text, then content description, then resource id, then class name.
std::string label_for(const protocol::ScreenElement& element);

}  // namespace mobilemcp::codec::ui
