#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "codec/content.hpp"
#include "devices/android_driver.hpp"
#include "fake_command_runner.hpp"

namespace {

using mobilemcp::core::config::AdbEndpoint;
using mobilemcp::core::errors::ErrorCategory;
using mobilemcp::core::errors::get_error;
using mobilemcp::core::errors::get_value;
using mobilemcp::core::errors::is_error;
using mobilemcp::devices::AndroidDriver;
using mobilemcp::protocol::Button;
using mobilemcp::protocol::Device;
using mobilemcp::protocol::DeviceKind;
using mobilemcp::protocol::Orientation;
using mobilemcp::protocol::Platform;
using mobilemcp::protocol::UiDumpPolicy;
using mobilemcp::test_support::fake_png;
using mobilemcp::test_support::FakeCommandRunner;

Device emulator(const std::string& state = "device") {
    return Device{"emulator-5554", "sdk gphone64", Platform::Android, DeviceKind::Emulator, state};
}

AndroidDriver make_driver(const FakeCommandRunner& runner,
                          UiDumpPolicy policy = UiDumpPolicy::Strict) {
    return AndroidDriver(runner, AdbEndpoint{}, 30000, policy);
}

TEST(AndroidDriverTest, ListsDevicesThroughConfiguredServer) {
    FakeCommandRunner runner;
    runner.on_stdout("devices -l",
                     "List of devices attached\n"
                     "emulator-5554 device product:sdk model:sdk_gphone64 transport_id:1\n");
    AndroidDriver driver(runner, AdbEndpoint{"/sdk/adb", "10.0.0.2", 5038}, 30000,
                         UiDumpPolicy::Strict);

    auto result = driver.list_devices();
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).size(), 1u);
    EXPECT_EQ(get_value(result)[0].display_name, "sdk gphone64");

    ASSERT_EQ(runner.calls().size(), 1u);
    const std::vector<std::string> expected = {"/sdk/adb", "-H", "10.0.0.2", "-P", "5038",
                                               "devices", "-l"};
    EXPECT_EQ(runner.calls()[0].argv, expected);
}

TEST(AndroidDriverTest, MissingAdbMeansNoDevices) {
    FakeCommandRunner runner;
    runner.on_missing("devices -l");
    const auto driver = make_driver(runner);

    auto result = driver.list_devices();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());
}

TEST(AndroidDriverTest, FailingAdbIsAnError) {
    FakeCommandRunner runner;
    runner.on_failure("devices -l", 1, "cannot connect to daemon");
    const auto driver = make_driver(runner);

    auto result = driver.list_devices();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "subprocess_failed");
}

TEST(AndroidDriverTest, OnlyOnlineDevicesAreReady) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    EXPECT_FALSE(is_error(driver.check_ready(emulator())));

    auto offline = driver.check_ready(emulator("offline"));
    ASSERT_TRUE(is_error(offline));
    EXPECT_EQ(get_error(offline).category, ErrorCategory::Device);
    EXPECT_EQ(get_error(offline).code, "device_not_ready");

    auto unauthorized = driver.check_ready(emulator("unauthorized"));
    ASSERT_TRUE(is_error(unauthorized));
    EXPECT_FALSE(get_error(unauthorized).hint.empty());
}

TEST(AndroidDriverTest, ScreenshotOnSingleDisplay) {
    FakeCommandRunner runner;
    runner.on_stdout("exec-out screencap -p", fake_png());
    const auto driver = make_driver(runner);

    auto result = driver.take_screenshot(emulator());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), fake_png());

    const auto* capture = runner.find_call("screencap");
    ASSERT_NE(capture, nullptr);
    EXPECT_EQ(capture->argv.back(), "-p");
}

TEST(AndroidDriverTest, ScreenshotTargetsActiveDisplay) {
    FakeCommandRunner runner;
    runner.on_stdout("SurfaceFlinger --display-id",
                     "Display 4619827259835644672 (HWC display 0): port=0\n"
                     "Display 4619827551948147201 (HWC display 1): port=1\n");
    runner.on_stdout("cmd display get-displays",
                     "Display id 0: DisplayInfo{\"Inner\", displayId 0, state OFF, "
                     "uniqueId \"local:4619827259835644672\"}\n"
                     "Display id 1: DisplayInfo{\"Outer\", displayId 1, state ON, "
                     "uniqueId \"local:4619827551948147201\"}\n");
    runner.on_stdout("exec-out screencap -p", fake_png());
    const auto driver = make_driver(runner);

    auto result = driver.take_screenshot(emulator());
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(runner.ran("screencap -p -d 4619827551948147201"));
}

TEST(AndroidDriverTest, ScreenshotRejectsNonPngOutput) {
    FakeCommandRunner runner;
    runner.on_stdout("exec-out screencap -p", "error: no devices/emulators found");
    const auto driver = make_driver(runner);

    auto result = driver.take_screenshot(emulator());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_png");
}

TEST(AndroidDriverTest, ReadsScreenSizeAndOrientation) {
    FakeCommandRunner runner;
    runner.on_stdout("wm size", "Physical size: 1080x2400\nOverride size: 720x1600\n");
    runner.on_stdout("user_rotation", "1\n");
    const auto driver = make_driver(runner);

    auto size = driver.get_screen_size(emulator());
    ASSERT_FALSE(is_error(size));
    EXPECT_EQ(get_value(size).width, 720);

    auto orientation = driver.get_orientation(emulator());
    ASSERT_FALSE(is_error(orientation));
    EXPECT_EQ(get_value(orientation), Orientation::Landscape);
}

TEST(AndroidDriverTest, ListAppsFallsBackToPackageList) {
    FakeCommandRunner runner;
    runner.on_failure("query-activities", 255, "Unknown command: query-activities");
    runner.on_stdout("pm list packages -3", "package:com.example.notes\n");
    const auto driver = make_driver(runner);

    auto result = driver.list_apps(emulator());
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).size(), 1u);
    EXPECT_EQ(get_value(result)[0].package_name, "com.example.notes");
}

TEST(AndroidDriverTest, ListsFilteredElements) {
    FakeCommandRunner runner;
    runner.on_stdout("exec-out cat /sdcard/window_dump.xml",
                     "<hierarchy rotation=\"0\">"
                     "<node text=\"Login\" class=\"android.widget.Button\" clickable=\"true\" "
                     "bounds=\"[0,0][100,50]\" />"
                     "<node text=\"Cancel\" class=\"android.widget.Button\" clickable=\"true\" "
                     "bounds=\"[0,60][100,110]\" />"
                     "</hierarchy>");
    const auto driver = make_driver(runner);

    auto result = driver.list_elements(emulator(), "login");
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).elements.size(), 1u);
    EXPECT_EQ(get_value(result).elements[0].text, "Login");
    EXPECT_TRUE(runner.ran("uiautomator dump /sdcard/window_dump.xml"));
}

TEST(AndroidDriverTest, TruncatedDumpFollowsPolicy) {
    FakeCommandRunner runner;
    runner.on_stdout("exec-out cat",
                     "<hierarchy rotation=\"0\"><node text=\"A\" class=\"V\" "
                     "bounds=\"[0,0][10,10]\" /><node text=\"B\"");

    auto strict = make_driver(runner, UiDumpPolicy::Strict).list_elements(emulator(), "");
    ASSERT_TRUE(is_error(strict));
    EXPECT_EQ(get_error(strict).code, "ui_dump_truncated");

    auto partial = make_driver(runner, UiDumpPolicy::Partial).list_elements(emulator(), "");
    ASSERT_FALSE(is_error(partial));
    EXPECT_TRUE(get_value(partial).truncated);
    EXPECT_EQ(get_value(partial).elements.size(), 1u);
}

TEST(AndroidDriverTest, TapGestures) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto tap = driver.tap(emulator(), 100.4, 200.6);
    ASSERT_FALSE(is_error(tap));
    EXPECT_EQ(get_value(tap), "Tapped at (100, 201)");
    EXPECT_TRUE(runner.ran("shell input tap 100 201"));

    auto double_tap = driver.double_tap(emulator(), 10, 20);
    ASSERT_FALSE(is_error(double_tap));
    EXPECT_EQ(runner.count("input tap 10 20"), 2u);

    auto long_press = driver.long_press(emulator(), 5, 6, 1500);
    ASSERT_FALSE(is_error(long_press));
    EXPECT_EQ(get_value(long_press), "Long pressed at (5, 6) for 1500ms");
    EXPECT_TRUE(runner.ran("input swipe 5 6 5 6 1500"));

    auto swipe = driver.swipe(emulator(), 500, 1500, 500, 300, 300);
    ASSERT_FALSE(is_error(swipe));
    EXPECT_EQ(get_value(swipe), "Swiped from (500, 1500) to (500, 300) in 300ms");
}

TEST(AndroidDriverTest, FailedInputSurfacesStderr) {
    FakeCommandRunner runner;
    runner.on_failure("input tap", 1, "error: device offline");
    const auto driver = make_driver(runner);

    auto result = driver.tap(emulator(), 1, 1);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Subprocess);
    EXPECT_NE(get_error(result).message.find("device offline"), std::string::npos);
}

TEST(AndroidDriverTest, TypesEscapedAsciiInChunks) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto short_text = driver.type_text(emulator(), "hello world");
    ASSERT_FALSE(is_error(short_text));
    EXPECT_EQ(get_value(short_text), "Typed text: hello world");
    EXPECT_TRUE(runner.ran("input text hello%sworld"));

    runner.clear_calls();
    auto long_text = driver.type_text(emulator(), std::string(250, 'a'));
    ASSERT_FALSE(is_error(long_text));
    EXPECT_EQ(runner.count("input text"), 3u);

    runner.clear_calls();
    auto empty = driver.type_text(emulator(), "");
    ASSERT_FALSE(is_error(empty));
    EXPECT_TRUE(runner.calls().empty());
}

TEST(AndroidDriverTest, NonAsciiTextNeedsDeviceKit) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.type_text(emulator(), "caf\xC3\xA9");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::PlatformUnsupported);
    EXPECT_EQ(get_error(result).code, "non_ascii_unsupported");
    EXPECT_FALSE(runner.ran("input text"));
}

TEST(AndroidDriverTest, NonAsciiTextPastesThroughDeviceKit) {
    FakeCommandRunner runner;
    runner.on_stdout("pm list packages com.mobilenext.devicekit",
                     "package:com.mobilenext.devicekit\n");
    const auto driver = make_driver(runner);
    const std::string text = "caf\xC3\xA9";

    auto result = driver.type_text(emulator(), text);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(runner.ran("devicekit.clipboard.set -e encoding base64 -e text " +
                           mobilemcp::codec::base64_encode(text)));
    EXPECT_TRUE(runner.ran("input keyevent KEYCODE_PASTE"));
    EXPECT_TRUE(runner.ran("devicekit.clipboard.clear"));
}

TEST(AndroidDriverTest, PressesButtonByKeycode) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.press_button(emulator(), Button::Home);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Pressed home (keycode 3)");
    EXPECT_TRUE(runner.ran("input keyevent 3"));
}

TEST(AndroidDriverTest, LaunchesWithMonkey) {
    FakeCommandRunner runner;
    runner.on_stdout("monkey", "Events injected: 1\n");
    const auto driver = make_driver(runner);

    auto result = driver.launch_app(emulator(), "com.example.app");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Launched com.example.app");
    EXPECT_FALSE(runner.ran("resolve-activity"));
}

TEST(AndroidDriverTest, LaunchFallsBackToResolvedActivity) {
    FakeCommandRunner runner;
    runner.on_stdout("monkey", "** No activities found to run, monkey aborted.\n");
    runner.on_stdout("resolve-activity",
                     "priority=0 preferredOrder=0 match=0x108000\ncom.example.app/.Main\n");
    const auto driver = make_driver(runner);

    auto result = driver.launch_app(emulator(), "com.example.app");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Launched com.example.app (com.example.app/.Main)");
    EXPECT_TRUE(runner.ran("am start -n com.example.app/.Main"));
}

TEST(AndroidDriverTest, LaunchFailsWithoutLauncherActivity) {
    FakeCommandRunner runner;
    runner.on_stdout("monkey", "** No activities found to run, monkey aborted.\n");
    runner.on_stdout("resolve-activity", "No activity found\n");
    const auto driver = make_driver(runner);

    auto result = driver.launch_app(emulator(), "com.example.missing");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "launch_failed");
}

TEST(AndroidDriverTest, RejectsUnsafeAppIds) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto launch = driver.launch_app(emulator(), "com.example;reboot");
    ASSERT_TRUE(is_error(launch));
    EXPECT_EQ(get_error(launch).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(launch).code, "invalid_app_id");

    EXPECT_TRUE(is_error(driver.terminate_app(emulator(), "a b")));
    EXPECT_TRUE(is_error(driver.uninstall_app(emulator(), "")));
    EXPECT_TRUE(runner.calls().empty());
}

TEST(AndroidDriverTest, TerminatesWithForceStop) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.terminate_app(emulator(), "com.example.app");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(runner.ran("shell am force-stop com.example.app"));
}

TEST(AndroidDriverTest, InstallUsesLongTimeoutAndChecksSuccess) {
    FakeCommandRunner runner;
    runner.on_stdout("install -r", "Performing Streamed Install\nSuccess\n");
    const auto driver = make_driver(runner);

    auto result = driver.install_app(emulator(), "/tmp/app.apk");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Installed /tmp/app.apk");
    const auto* install = runner.find_call("install -r /tmp/app.apk");
    ASSERT_NE(install, nullptr);
    EXPECT_EQ(install->timeout_ms, 300000u);
}

TEST(AndroidDriverTest, InstallFailureIsReported) {
    FakeCommandRunner runner;
    runner.on_stdout("install -r", "Failure [INSTALL_FAILED_VERSION_DOWNGRADE]\n");
    const auto driver = make_driver(runner);

    auto result = driver.install_app(emulator(), "/tmp/app.apk");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "install_failed");
    EXPECT_NE(get_error(result).message.find("INSTALL_FAILED_VERSION_DOWNGRADE"),
              std::string::npos);
}

TEST(AndroidDriverTest, UninstallChecksSuccess) {
    FakeCommandRunner runner;
    runner.on_stdout("uninstall", "Failure [DELETE_FAILED_INTERNAL_ERROR]\n");
    const auto driver = make_driver(runner);

    auto result = driver.uninstall_app(emulator(), "com.example.app");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "uninstall_failed");
}

TEST(AndroidDriverTest, OpensUrlQuotedForDeviceShell) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.open_url(emulator(), "https://example.com/?a=1&b='2'");
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Opened https://example.com/?a=1&b='2'");
    const auto* start = runner.find_call("android.intent.action.VIEW");
    ASSERT_NE(start, nullptr);
    EXPECT_EQ(start->argv.back(), "'https://example.com/?a=1&b='\\''2'\\'''");
}

TEST(AndroidDriverTest, SetsOrientation) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.set_orientation(emulator(), Orientation::Landscape);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Orientation set to landscape");
    EXPECT_TRUE(runner.ran("settings put system accelerometer_rotation 0"));
    EXPECT_TRUE(runner.ran("settings put system user_rotation 1"));
}

}  // namespace
