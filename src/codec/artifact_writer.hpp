#pragma once

#include <filesystem>
#include <string>
#include "core/errors/mobile_errors.hpp"

namespace mobilemcp::codec {

// Writes captured bytes (screenshots) to caller-chosen paths.
class ArtifactWriter {
public:
    // Creates missing parent directories. Returns the absolute path written.
    core::errors::Result<std::filesystem::path> write_bytes(const std::filesystem::path& path,
                                                            const std::string& bytes) const;

    core::errors::Result<std::string> read_bytes(const std::filesystem::path& path) const;
};

}  // namespace mobilemcp::codec
