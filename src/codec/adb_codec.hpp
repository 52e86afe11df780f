#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/mobile_errors.hpp"
#include "protocol/device_contract.hpp"

namespace mobilemcp::codec::adb {

// `adb devices -l`. Fails when the header line is missing (adb printed an error instead).
core::errors::Result<std::vector<protocol::Device>> parse_devices(const std::string& text);

// `wm size`: "Physical size: WxH", a bare "WxH", or "Override size: WxH" which wins.
core::errors::Result<protocol::ScreenSize> parse_wm_size(const std::string& text);

// `settings get system user_rotation`: 0/2/null portrait, 1/3 landscape.
core::errors::Result<protocol::Orientation> parse_user_rotation(const std::string& text);

// `pm list packages` lines of the form "package:<name>".
std::vector<protocol::InstalledApp> parse_package_list(const std::string& text);

// `cmd package query-activities`: "packageName=<name>" lines, first occurrence wins.
std::vector<protocol::InstalledApp> parse_launcher_activities(const std::string& text);

// `cmd package resolve-activity --brief`: last line is "<pkg>/<activity>".
std::optional<std::string> parse_resolved_activity(const std::string& text);

// `dumpsys SurfaceFlinger --display-id`: one "Display <id> ..." line per display.
std::size_t count_displays(const std::string& text);

// `cmd display get-displays`: uniqueId of the first display in state ON.
std::optional<std::string> parse_active_display_id(const std::string& text);

// `dumpsys display`: uniqueId of the active INTERNAL viewport.
std::optional<std::string> parse_viewport_display_id(const std::string& text);

bool is_valid_app_id(const std::string& app_id);

// `monkey` exits 0 even when the package has no launcher activity.
bool monkey_failed(int exit_code, const std::string& output);

// adb install/uninstall report "Success" on stdout; anything else is a failure.
bool reports_success(const std::string& output);

int keycode_for(protocol::Button button);

constexpr std::size_t kInputTextChunk = 100;

bool is_ascii(const std::string& text);

// Escapes one chunk for `input text`: shell metacharacters get a backslash, space becomes %s.
std::string encode_input_text(const std::string& text);

// Chunks of at most chunk_size characters (0 = unbounded). A literal "%s" in the
// text is split between two chunks.
std::vector<std::string> split_chunks(const std::string& text, std::size_t chunk_size);

}  // namespace mobilemcp::codec::adb
