#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/mobile_errors.hpp"

namespace mobilemcp::tools {

// Checks `arguments` against an object schema (type, properties, required,
// enum, minimum) and returns a copy with declared defaults filled in.
// Arguments the schema does not mention pass through untouched.
core::errors::Result<nlohmann::json> validate_arguments(const nlohmann::json& schema,
                                                        const nlohmann::json& arguments);

}  // namespace mobilemcp::tools
