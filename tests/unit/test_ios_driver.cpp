#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>
#include <gtest/gtest.h>
#include "devices/ios_driver.hpp"
#include "fake_command_runner.hpp"

namespace {

using mobilemcp::core::errors::ErrorCategory;
using mobilemcp::core::errors::get_error;
using mobilemcp::core::errors::get_value;
using mobilemcp::core::errors::is_error;
using mobilemcp::devices::IosDriver;
using mobilemcp::protocol::Button;
using mobilemcp::protocol::Device;
using mobilemcp::protocol::DeviceKind;
using mobilemcp::protocol::Orientation;
using mobilemcp::protocol::Platform;
using mobilemcp::test_support::fake_png;
using mobilemcp::test_support::FakeCommandRunner;

const char* kSimulatorsJson = R"({"devices": {
  "com.apple.CoreSimulator.SimRuntime.iOS-17-0": [
    {"udid": "SIM-1", "name": "iPhone 15", "state": "Booted"}
  ]}})";

Device simulator(const std::string& state = "booted") {
    return Device{"SIM-1", "iPhone 15 (iOS 17.0)", Platform::Ios, DeviceKind::Simulator, state};
}

Device physical() {
    return Device{"00008110-001A2B3C4D5E6F70", "iOS device (00008110)", Platform::Ios,
                  DeviceKind::Physical, "connected"};
}

IosDriver make_driver(const FakeCommandRunner& runner) {
    return IosDriver(runner, "xcrun", 30000);
}

TEST(IosDriverTest, ListsSimulatorsAndPhysicalDevices) {
    FakeCommandRunner runner;
    runner.on_stdout("simctl list devices available --json", kSimulatorsJson);
    runner.on_stdout("idevice_id -l", "00008110-001A2B3C4D5E6F70\n");
    const auto driver = make_driver(runner);

    auto result = driver.list_devices();
    ASSERT_FALSE(is_error(result));
    const auto& devices = get_value(result);
    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].id, "SIM-1");
    EXPECT_EQ(devices[0].kind, DeviceKind::Simulator);
    EXPECT_EQ(devices[1].kind, DeviceKind::Physical);
}

TEST(IosDriverTest, MissingToolsMeanNoDevices) {
    FakeCommandRunner runner;
    runner.on_missing("simctl list");
    runner.on_missing("idevice_id");
    const auto driver = make_driver(runner);

    auto result = driver.list_devices();
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());
}

TEST(IosDriverTest, FailingIdeviceIdStillListsSimulators) {
    FakeCommandRunner runner;
    runner.on_stdout("simctl list", kSimulatorsJson);
    runner.on_failure("idevice_id", 1, "ERROR: Unable to retrieve device list!");
    const auto driver = make_driver(runner);

    auto result = driver.list_devices();
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).size(), 1u);
}

TEST(IosDriverTest, FailingSimctlIsAnError) {
    FakeCommandRunner runner;
    runner.on_failure("simctl list", 72, "xcrun: error: unable to find utility \"simctl\"");
    const auto driver = make_driver(runner);

    auto result = driver.list_devices();
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Subprocess);
}

TEST(IosDriverTest, SimulatorMustBeBooted) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    EXPECT_FALSE(is_error(driver.check_ready(simulator())));
    EXPECT_FALSE(is_error(driver.check_ready(physical())));

    auto shutdown = driver.check_ready(simulator("shutdown"));
    ASSERT_TRUE(is_error(shutdown));
    EXPECT_EQ(get_error(shutdown).code, "device_not_ready");
    EXPECT_NE(get_error(shutdown).hint.find("xcrun simctl boot SIM-1"), std::string::npos);
}

TEST(IosDriverTest, SimulatorScreenshot) {
    FakeCommandRunner runner;
    runner.on_stdout("io SIM-1 screenshot", fake_png());
    const auto driver = make_driver(runner);

    auto result = driver.take_screenshot(simulator());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), fake_png());
    const std::vector<std::string> expected = {"xcrun", "simctl", "io", "SIM-1", "screenshot",
                                               "--type=png", "-"};
    EXPECT_EQ(runner.calls()[0].argv, expected);
}

TEST(IosDriverTest, PhysicalScreenshotWithoutOutputFileFails) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.take_screenshot(physical());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "input_open_failed");
    EXPECT_TRUE(runner.ran("idevicescreenshot -u 00008110-001A2B3C4D5E6F70"));
}

TEST(IosDriverTest, ScreenSizeFromModel) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.get_screen_size(simulator());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).width, 390);
    EXPECT_EQ(get_value(result).height, 844);
    EXPECT_DOUBLE_EQ(get_value(result).scale, 3.0);
}

TEST(IosDriverTest, ScreenSizeIgnoresRuntimeVersion) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    // "11" in the runtime label must not select the 11-inch iPad Pro size.
    const Device ipad{"SIM-2", "iPad (9th generation) (iOS 11.4)", Platform::Ios,
                      DeviceKind::Simulator, "booted", "iPad (9th generation)"};
    auto result = driver.get_screen_size(ipad);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).width, 810);
    EXPECT_EQ(get_value(result).height, 1080);
}

TEST(IosDriverTest, OrientationAndElementsAreUnsupported) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto orientation = driver.get_orientation(simulator());
    ASSERT_TRUE(is_error(orientation));
    EXPECT_EQ(get_error(orientation).category, ErrorCategory::PlatformUnsupported);

    auto elements = driver.list_elements(simulator(), "");
    ASSERT_TRUE(is_error(elements));
    EXPECT_EQ(get_error(elements).code, "unsupported_operation");
    EXPECT_TRUE(runner.calls().empty());
}

TEST(IosDriverTest, PhysicalDevicesOnlySupportScreenshots) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto tap = driver.tap(physical(), 1, 1);
    ASSERT_TRUE(is_error(tap));
    EXPECT_EQ(get_error(tap).category, ErrorCategory::PlatformUnsupported);
    EXPECT_EQ(get_error(tap).message, "tap is not supported on iOS physical devices");

    EXPECT_TRUE(is_error(driver.launch_app(physical(), "com.example")));
    EXPECT_TRUE(is_error(driver.list_apps(physical())));
    EXPECT_TRUE(runner.calls().empty());
}

TEST(IosDriverTest, TapsInPoints) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.tap(simulator(), 100, 200.5);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "Tapped at (100, 200.5)");
    const std::vector<std::string> expected = {"xcrun", "simctl", "io", "SIM-1",
                                               "tap",   "100",    "200.5"};
    EXPECT_EQ(runner.calls()[0].argv, expected);
}

TEST(IosDriverTest, LongPressDegradesToTap) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto result = driver.long_press(simulator(), 50, 60, 2000);
    ASSERT_FALSE(is_error(result));
    EXPECT_NE(get_value(result).find("2000ms duration was not honored"), std::string::npos);
    EXPECT_TRUE(runner.ran("io SIM-1 tap 50 60"));
}

TEST(IosDriverTest, SwipeAndType) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    ASSERT_FALSE(is_error(driver.swipe(simulator(), 10, 20, 30, 40, 300)));
    EXPECT_TRUE(runner.ran("io SIM-1 swipe 10 20 30 40"));

    auto typed = driver.type_text(simulator(), "hello world");
    ASSERT_FALSE(is_error(typed));
    const auto* call = runner.find_call("io SIM-1 type");
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->argv.back(), "hello world");
}

TEST(IosDriverTest, PressesOnlySimulatorButtons) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto home = driver.press_button(simulator(), Button::Home);
    ASSERT_FALSE(is_error(home));
    EXPECT_TRUE(runner.ran("io SIM-1 press home"));

    auto volume = driver.press_button(simulator(), Button::VolumeUp);
    ASSERT_FALSE(is_error(volume));
    EXPECT_TRUE(runner.ran("io SIM-1 press volumeUp"));

    auto back = driver.press_button(simulator(), Button::Back);
    ASSERT_TRUE(is_error(back));
    EXPECT_EQ(get_error(back).code, "unsupported_button");
}

TEST(IosDriverTest, AppLifecycle) {
    FakeCommandRunner runner;
    runner.on_stdout("listapps SIM-1",
                     R"({"com.apple.mobilesafari": {"CFBundleDisplayName": "Safari"}})");
    const auto driver = make_driver(runner);

    auto apps = driver.list_apps(simulator());
    ASSERT_FALSE(is_error(apps));
    ASSERT_EQ(get_value(apps).size(), 1u);
    EXPECT_EQ(get_value(apps)[0].app_name, "Safari");

    ASSERT_FALSE(is_error(driver.launch_app(simulator(), "com.apple.mobilesafari")));
    EXPECT_TRUE(runner.ran("simctl launch SIM-1 com.apple.mobilesafari"));
    ASSERT_FALSE(is_error(driver.terminate_app(simulator(), "com.apple.mobilesafari")));
    EXPECT_TRUE(runner.ran("simctl terminate SIM-1 com.apple.mobilesafari"));
    ASSERT_FALSE(is_error(driver.uninstall_app(simulator(), "com.example.demo")));
    EXPECT_TRUE(runner.ran("simctl uninstall SIM-1 com.example.demo"));
}

TEST(IosDriverTest, LaunchFailureCarriesSimctlMessage) {
    FakeCommandRunner runner;
    runner.on_failure("simctl launch", 4, "An error was encountered processing the command");
    const auto driver = make_driver(runner);

    auto result = driver.launch_app(simulator(), "com.example.missing");
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "subprocess_failed");
    EXPECT_NE(get_error(result).message.find("error was encountered"), std::string::npos);
}

TEST(IosDriverTest, InstallRequiresExistingBundle) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    auto missing = driver.install_app(simulator(), "/nonexistent/Demo.app");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(missing).code, "app_path_not_found");
    EXPECT_TRUE(runner.calls().empty());

    const auto bundle = std::filesystem::temp_directory_path() /
                        ("mobilemcp_demo_" + std::to_string(getpid()) + ".zip");
    {
        std::ofstream out(bundle);
        out << "zip";
    }
    auto installed = driver.install_app(simulator(), bundle.string());
    std::error_code ec;
    std::filesystem::remove(bundle, ec);
    ASSERT_FALSE(is_error(installed));
    const auto* call = runner.find_call("simctl install SIM-1");
    ASSERT_NE(call, nullptr);
    EXPECT_EQ(call->timeout_ms, 300000u);
}

TEST(IosDriverTest, OpensUrlAndRotates) {
    FakeCommandRunner runner;
    const auto driver = make_driver(runner);

    ASSERT_FALSE(is_error(driver.open_url(simulator(), "https://example.com")));
    EXPECT_TRUE(runner.ran("simctl openurl SIM-1 https://example.com"));

    auto rotated = driver.set_orientation(simulator(), Orientation::Landscape);
    ASSERT_FALSE(is_error(rotated));
    EXPECT_EQ(get_value(rotated), "Orientation set to landscape");
    EXPECT_TRUE(runner.ran("io SIM-1 orientation landscape"));
}

}  // namespace
