#include "tools/schema_validator.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace mobilemcp::tools {

using core::errors::ErrorCategory;
using core::errors::MobileError;
using nlohmann::json;

namespace {

bool matches_type(const json& value, const std::string& type) {
    if (type == "string") return value.is_string();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        // Handlers read integers as int64; anything outside that range is rejected here.
        if (value.is_number_unsigned()) {
            return value.get<std::uint64_t>() <=
                   static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        }
        if (value.is_number_integer()) {
            return true;
        }
        if (value.is_number_float()) {
            constexpr double kInt64Bound = 9223372036854775808.0;  // 2^63
            const double d = value.get<double>();
            return std::isfinite(d) && std::floor(d) == d && d >= -kInt64Bound &&
                   d < kInt64Bound;
        }
        return false;
    }
    if (type == "boolean") return value.is_boolean();
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    return true;
}

MobileError invalid(const std::string& message, const std::string& code) {
    return MobileError{ErrorCategory::Validation, message, code};
}

}  // namespace

core::errors::Result<json> validate_arguments(const json& schema, const json& arguments) {
    if (!arguments.is_object()) {
        return invalid("Tool arguments must be a JSON object.", "invalid_arguments");
    }

    json normalized = arguments;
    // JSON null counts as "not given".
    for (auto it = normalized.begin(); it != normalized.end();) {
        if (it->is_null()) {
            it = normalized.erase(it);
        } else {
            ++it;
        }
    }

    const json properties = schema.value("properties", json::object());
    const json required = schema.value("required", json::array());

    for (const auto& name : required) {
        if (!name.is_string()) {
            continue;
        }
        if (!normalized.contains(name.get<std::string>())) {
            return invalid("Missing required argument: " + name.get<std::string>(),
                           "missing_argument");
        }
    }

    for (const auto& [name, property] : properties.items()) {
        if (!normalized.contains(name)) {
            if (property.contains("default")) {
                normalized[name] = property.at("default");
            }
            continue;
        }

        const json& value = normalized.at(name);
        const std::string type = property.value("type", "");
        if (!type.empty() && !matches_type(value, type)) {
            return invalid("Argument '" + name + "' must be of type " + type, "invalid_type");
        }

        if (property.contains("enum")) {
            bool allowed = false;
            for (const auto& option : property.at("enum")) {
                if (option == value) {
                    allowed = true;
                    break;
                }
            }
            if (!allowed) {
                return invalid("Argument '" + name + "' must be one of " +
                                   property.at("enum").dump() + ", got " + value.dump(),
                               "invalid_enum_value");
            }
        }

        if (property.contains("minimum") && value.is_number()) {
            const double minimum = property.at("minimum").get<double>();
            if (value.get<double>() < minimum) {
                return invalid("Argument '" + name + "' must be >= " +
                                   property.at("minimum").dump() + ", got " + value.dump(),
                               "below_minimum");
            }
        }

        if (property.contains("maximum") && value.is_number()) {
            const double maximum = property.at("maximum").get<double>();
            if (value.get<double>() > maximum) {
                return invalid("Argument '" + name + "' must be <= " +
                                   property.at("maximum").dump() + ", got " + value.dump(),
                               "above_maximum");
            }
        }
    }

    return normalized;
}

}  // namespace mobilemcp::tools
