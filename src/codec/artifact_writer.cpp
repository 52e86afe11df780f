#include "codec/artifact_writer.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace mobilemcp::codec {

using core::errors::ErrorCategory;
using core::errors::MobileError;

core::errors::Result<std::filesystem::path> ArtifactWriter::write_bytes(
    const std::filesystem::path& path, const std::string& bytes) const {
    if (path.empty()) {
        return MobileError{ErrorCategory::Validation, "Output path cannot be empty.",
                           "invalid_output_path"};
    }

    std::error_code ec;
    const auto absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        return MobileError{ErrorCategory::Io, "Unable to resolve output path: " + path.string(),
                           "output_path_unresolvable"};
    }

    if (std::filesystem::is_directory(absolute, ec)) {
        return MobileError{ErrorCategory::Io,
                           "Output path is a directory: " + absolute.string(),
                           "output_path_is_directory"};
    }

    const auto parent = absolute.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return MobileError{ErrorCategory::Io,
                               "Unable to create directory " + parent.string() + ": " +
                                   ec.message(),
                               "output_dir_create_failed"};
        }
    }

    std::ofstream out(absolute, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return MobileError{ErrorCategory::Io, "Failed to open output file: " + absolute.string(),
                           "output_open_failed"};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) {
        return MobileError{ErrorCategory::Io, "Failed to write output file: " + absolute.string(),
                           "output_write_failed"};
    }
    return absolute;
}

core::errors::Result<std::string> ArtifactWriter::read_bytes(
    const std::filesystem::path& path) const {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return MobileError{ErrorCategory::Io, "Failed to open file: " + path.string(),
                           "input_open_failed"};
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return MobileError{ErrorCategory::Io, "Failed to read file: " + path.string(),
                           "input_read_failed"};
    }
    return bytes;
}

}  // namespace mobilemcp::codec
