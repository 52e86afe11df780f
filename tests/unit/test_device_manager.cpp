#include <string>
#include <variant>
#include <gtest/gtest.h>
#include "devices/device_manager.hpp"
#include "fake_command_runner.hpp"

namespace {

using mobilemcp::core::config::AdbEndpoint;
using mobilemcp::core::errors::ErrorCategory;
using mobilemcp::core::errors::get_error;
using mobilemcp::core::errors::get_value;
using mobilemcp::core::errors::is_error;
using mobilemcp::core::errors::Result;
using mobilemcp::devices::AndroidDriver;
using mobilemcp::devices::AndroidTarget;
using mobilemcp::devices::DeviceManager;
using mobilemcp::devices::DeviceRef;
using mobilemcp::devices::IosDriver;
using mobilemcp::devices::IosTarget;
using mobilemcp::protocol::Device;
using mobilemcp::protocol::Platform;
using mobilemcp::protocol::PlatformSelector;
using mobilemcp::protocol::UiDumpPolicy;
using mobilemcp::test_support::FakeCommandRunner;

const char* kAdbDevices =
    "List of devices attached\n"
    "emulator-5554 device product:sdk model:Pixel_7 transport_id:1\n"
    "R58M123ABC offline transport_id:2\n";

const char* kSimctlDevices = R"({"devices": {
  "com.apple.CoreSimulator.SimRuntime.iOS-17-0": [
    {"udid": "SIM-1", "name": "iPhone 15", "state": "Booted"}
  ]}})";

// Drivers and manager wired to one scripted runner.
class DeviceManagerTest : public ::testing::Test {
protected:
    DeviceManagerTest()
        : android_(runner_, AdbEndpoint{}, 30000, UiDumpPolicy::Strict),
          ios_(runner_, "xcrun", 30000),
          manager_(android_, ios_) {
        runner_.on_stdout("devices -l", kAdbDevices);
        runner_.on_stdout("simctl list", kSimctlDevices);
        runner_.on_missing("idevice_id");
    }

    FakeCommandRunner runner_;
    AndroidDriver android_;
    IosDriver ios_;
    DeviceManager manager_;
};

TEST_F(DeviceManagerTest, ListsBothPlatformsAndroidFirst) {
    const auto report = manager_.list_devices(PlatformSelector::Auto);
    ASSERT_EQ(report.devices.size(), 3u);
    EXPECT_EQ(report.devices[0].platform, Platform::Android);
    EXPECT_EQ(report.devices[2].id, "SIM-1");
    EXPECT_TRUE(report.warnings.empty());
}

TEST_F(DeviceManagerTest, SelectorLimitsDiscovery) {
    const auto report = manager_.list_devices(PlatformSelector::Android);
    EXPECT_EQ(report.devices.size(), 2u);
    EXPECT_FALSE(runner_.ran("simctl"));
}

TEST_F(DeviceManagerTest, FailingPlatformBecomesWarning) {
    runner_.on_failure("devices -l", 1, "adb server version mismatch");

    const auto report = manager_.list_devices(PlatformSelector::Auto);
    ASSERT_EQ(report.devices.size(), 1u);
    EXPECT_EQ(report.devices[0].id, "SIM-1");
    ASSERT_EQ(report.warnings.size(), 1u);
    EXPECT_EQ(report.warnings[0].rfind("Warning: android discovery failed: ", 0), 0u);
}

TEST_F(DeviceManagerTest, ResolvesEachPlatform) {
    auto android = manager_.resolve(DeviceRef{PlatformSelector::Auto, "emulator-5554"});
    ASSERT_FALSE(is_error(android));
    ASSERT_TRUE(std::holds_alternative<AndroidTarget>(get_value(android)));
    EXPECT_EQ(std::get<AndroidTarget>(get_value(android)).device.display_name, "Pixel 7");

    auto ios = manager_.resolve(DeviceRef{PlatformSelector::Auto, "SIM-1"});
    ASSERT_FALSE(is_error(ios));
    EXPECT_TRUE(std::holds_alternative<IosTarget>(get_value(ios)));
}

TEST_F(DeviceManagerTest, ExplicitPlatformOnlySearchesThatPlatform) {
    auto result = manager_.resolve(DeviceRef{PlatformSelector::Android, "SIM-1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "device_not_found");
    EXPECT_FALSE(runner_.ran("simctl"));
}

TEST_F(DeviceManagerTest, RejectsEmptyDeviceId) {
    auto result = manager_.resolve(DeviceRef{PlatformSelector::Auto, ""});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Validation);
    EXPECT_EQ(get_error(result).code, "missing_device_id");
}

TEST_F(DeviceManagerTest, UnknownDeviceIsNotFound) {
    auto result = manager_.resolve(DeviceRef{PlatformSelector::Auto, "nope"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Device);
    EXPECT_EQ(get_error(result).message, "Device not found: nope");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST_F(DeviceManagerTest, NotFoundHintCarriesDiscoveryFailures) {
    runner_.on_failure("simctl list", 1, "CoreSimulatorService connection invalid");

    auto result = manager_.resolve(DeviceRef{PlatformSelector::Auto, "SIM-1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "device_not_found");
    EXPECT_NE(get_error(result).hint.find("ios discovery failed"), std::string::npos);
}

TEST_F(DeviceManagerTest, ExplicitPlatformReturnsDiscoveryError) {
    runner_.on_failure("simctl list", 1, "CoreSimulatorService connection invalid");

    auto result = manager_.resolve(DeviceRef{PlatformSelector::Ios, "SIM-1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "subprocess_failed");
}

TEST_F(DeviceManagerTest, SameIdOnBothPlatformsIsAmbiguous) {
    runner_.on_stdout("devices -l", "List of devices attached\nSIM-1 device\n");

    auto result = manager_.resolve(DeviceRef{PlatformSelector::Auto, "SIM-1"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "ambiguous_device");

    auto explicit_ios = manager_.resolve(DeviceRef{PlatformSelector::Ios, "SIM-1"});
    ASSERT_FALSE(is_error(explicit_ios));
    EXPECT_TRUE(std::holds_alternative<IosTarget>(get_value(explicit_ios)));
}

TEST_F(DeviceManagerTest, RouteDispatchesToMatchingDriver) {
    auto result = manager_.route<std::string>(
        DeviceRef{PlatformSelector::Auto, "SIM-1"}, "tap",
        [](const auto& driver, const Device& device) { return driver.tap(device, 3, 4); });
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(runner_.ran("simctl io SIM-1 tap 3 4"));
    EXPECT_FALSE(runner_.ran("input tap"));
}

TEST_F(DeviceManagerTest, RouteStopsAtOfflineDevice) {
    bool invoked = false;
    auto result = manager_.route<std::string>(
        DeviceRef{PlatformSelector::Auto, "R58M123ABC"}, "tap",
        [&invoked](const auto&, const Device&) -> Result<std::string> {
            invoked = true;
            return std::string("unreachable");
        });
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "device_not_ready");
    EXPECT_FALSE(invoked);
}

TEST(CallStateTest, Names) {
    using mobilemcp::devices::CallState;
    EXPECT_EQ(mobilemcp::devices::to_string(CallState::Resolving), "resolving");
    EXPECT_EQ(mobilemcp::devices::to_string(CallState::Failed), "failed");
}

}  // namespace
