#include "codec/ui_hierarchy.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <system_error>

namespace mobilemcp::codec::ui {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using protocol::ElementBounds;
using protocol::ElementListing;
using protocol::ScreenElement;

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool contains_ci(const std::string& haystack, const std::string& lowered_needle) {
    return to_lower(haystack).find(lowered_needle) != std::string::npos;
}

void append_utf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

bool is_name_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == ':';
}

// Scans name="value" pairs in one pass. Values never contain a raw quote, so the
// next '"' ends the value whatever its length.
ScreenElement element_from_attributes(const std::string& attrs, bool& has_bounds) {
    ScreenElement element;
    has_bounds = false;
    std::size_t pos = 0;
    while (pos < attrs.size()) {
        const auto assign = attrs.find("=\"", pos);
        if (assign == std::string::npos) {
            break;
        }
        std::size_t name_begin = assign;
        while (name_begin > pos && is_name_char(attrs[name_begin - 1])) {
            --name_begin;
        }
        const auto value_begin = assign + 2;
        const auto value_end = attrs.find('"', value_begin);
        if (value_end == std::string::npos) {
            break;
        }
        pos = value_end + 1;

        const std::string name = attrs.substr(name_begin, assign - name_begin);
        if (name.empty()) {
            continue;
        }
        const std::string value =
            decode_entities(attrs.substr(value_begin, value_end - value_begin));

        if (name == "class") element.class_name = value;
        else if (name == "text") element.text = value;
        else if (name == "content-desc") element.content_desc = value;
        else if (name == "resource-id") element.resource_id = value;
        else if (name == "clickable") element.clickable = (value == "true");
        else if (name == "focused") element.focused = (value == "true");
        else if (name == "bounds") {
            auto bounds = parse_bounds(value);
            if (bounds) {
                element.bounds = *bounds;
                has_bounds = true;
            }
        }
    }
    return element;
}

}  // namespace

std::optional<ElementBounds> parse_bounds(const std::string& bounds) {
    constexpr std::size_t kMaxBoundsLength = 64;
    if (bounds.size() > kMaxBoundsLength) {
        return std::nullopt;
    }
    static const std::regex bounds_regex(R"(\[(-?\d+),(-?\d+)\]\[(-?\d+),(-?\d+)\])");
    std::smatch match;
    if (!std::regex_match(bounds, match, bounds_regex)) {
        return std::nullopt;
    }

    int values[4] = {0, 0, 0, 0};
    for (int i = 0; i < 4; ++i) {
        const std::string part = match[i + 1];
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), values[i]);
        if (ec != std::errc() || ptr != part.data() + part.size()) {
            return std::nullopt;
        }
    }
    return ElementBounds{values[0], values[1], values[2] - values[0], values[3] - values[1]};
}

std::string decode_entities(const std::string& value) {
    if (value.find('&') == std::string::npos) {
        return value;
    }

    std::string out;
    out.reserve(value.size());
    std::size_t i = 0;
    while (i < value.size()) {
        if (value[i] != '&') {
            out.push_back(value[i++]);
            continue;
        }
        const auto semi = value.find(';', i);
        if (semi == std::string::npos || semi - i > 10) {
            out.push_back(value[i++]);
            continue;
        }
        const std::string entity = value.substr(i + 1, semi - i - 1);
        if (entity == "amp") out.push_back('&');
        else if (entity == "lt") out.push_back('<');
        else if (entity == "gt") out.push_back('>');
        else if (entity == "quot") out.push_back('"');
        else if (entity == "apos") out.push_back('\'');
        else if (entity.size() > 1 && entity[0] == '#') {
            const bool hex = entity[1] == 'x' || entity[1] == 'X';
            const std::string digits = entity.substr(hex ? 2 : 1);
            unsigned long code_point = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(),
                                             code_point, hex ? 16 : 10);
            if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
                out.append(value, i, semi - i + 1);
            } else {
                append_utf8(out, code_point);
            }
        } else {
            out.append(value, i, semi - i + 1);
        }
        i = semi + 1;
    }
    return out;
}

core::errors::Result<ElementListing> parse_hierarchy(const std::string& xml,
                                                     const protocol::UiDumpPolicy policy) {
    if (xml.find("<hierarchy") == std::string::npos) {
        std::string snippet = xml.substr(0, std::min<std::size_t>(xml.size(), 200));
        return MobileError{ErrorCategory::Subprocess,
                           "UI dump is not a view hierarchy: " +
                               (snippet.empty() ? std::string("<empty>") : snippet),
                           "unparsable_output"};
    }

    ElementListing listing;
    bool truncated = xml.find("</hierarchy>") == std::string::npos;

    std::size_t pos = 0;
    while (true) {
        const auto open = xml.find("<node", pos);
        if (open == std::string::npos) {
            break;
        }
        const auto close = xml.find('>', open);
        if (close == std::string::npos) {
            truncated = true;  // cut off inside a tag
            break;
        }
        pos = close + 1;

        std::size_t attrs_end = close;
        if (attrs_end > open && xml[attrs_end - 1] == '/') {
            --attrs_end;
        }
        const std::string attrs = xml.substr(open + 5, attrs_end - open - 5);
        ++listing.parsed_nodes;

        bool has_bounds = false;
        ScreenElement element = element_from_attributes(attrs, has_bounds);
        if (!has_bounds || element.bounds.width <= 0 || element.bounds.height <= 0) {
            continue;
        }
        listing.elements.push_back(std::move(element));
    }

    if (truncated) {
        if (policy == protocol::UiDumpPolicy::Strict) {
            return MobileError{ErrorCategory::Subprocess,
                               "UI dump is truncated after " +
                                   std::to_string(listing.parsed_nodes) + " nodes.",
                               "ui_dump_truncated",
                               "Retry, or start the server with --ui-dump partial."};
        }
        listing.truncated = true;
    }
    return listing;
}

std::vector<ScreenElement> filter_elements(const std::vector<ScreenElement>& elements,
                                           const std::string& filter) {
    if (filter.empty()) {
        return elements;
    }
    const std::string needle = to_lower(filter);
    std::vector<ScreenElement> kept;
    for (const auto& element : elements) {
        if (contains_ci(element.text, needle) || contains_ci(element.content_desc, needle) ||
            contains_ci(element.resource_id, needle) || contains_ci(element.class_name, needle)) {
            kept.push_back(element);
        }
    }
    return kept;
}

std::string label_for(const ScreenElement& element) {
    if (!element.text.empty()) {
        return element.text;
    }
    if (!element.content_desc.empty()) {
        return element.content_desc;
    }
    if (!element.resource_id.empty()) {
        return element.resource_id;
    }
    return element.class_name.empty() ? "Unknown" : element.class_name;
}

}  // namespace mobilemcp::codec::ui
