#include "device-scanner.hpp"
#include "fake-ble-adapter.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

using namespace std::chrono_literals;

namespace {

DeviceAdvertisement Advertisement(std::string address, std::optional<std::string> name, int rssi) {
    DeviceAdvertisement adv;
    adv.address = std::move(address);
    adv.name = std::move(name);
    adv.rssi = rssi;
    return adv;
}

} // namespace

TEST(DeviceScanner, KeepsHealthDevicesOnly) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->advertisements = {
        Advertisement("00:00:00:00:00:01", std::string("Polar H10 1234"), -60),
        Advertisement("00:00:00:00:00:02", std::string("Kitchen Speaker"), -40),
        Advertisement("00:00:00:00:00:03", std::string("HEART monitor"), -70),
        Advertisement("00:00:00:00:00:04", std::nullopt, -30),
        Advertisement("00:00:00:00:00:05", std::string(""), -35),
    };

    DeviceScanner scanner(adapter);
    auto devices = scanner.Scan(20ms);

    ASSERT_EQ(devices.size(), 2u);
    EXPECT_EQ(devices[0].address, "00:00:00:00:00:01");
    EXPECT_EQ(devices[1].address, "00:00:00:00:00:03");
    EXPECT_EQ(*devices[1].name, "HEART monitor");
}

TEST(DeviceScanner, SortedByDescendingRssi) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->advertisements = {
        Advertisement("00:00:00:00:00:01", std::string("Garmin Venu"), -80),
        Advertisement("00:00:00:00:00:02", std::string("Fitbit Charge"), -45),
        Advertisement("00:00:00:00:00:03", std::string("HUAWEI WATCH"), -62),
    };

    auto devices = DeviceScanner(adapter).Scan(10ms);

    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].rssi, -45);
    EXPECT_EQ(devices[1].rssi, -62);
    EXPECT_EQ(devices[2].rssi, -80);
}

TEST(DeviceScanner, EmptyEnvironmentWaitsForTimeout) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    DeviceScanner scanner(adapter);

    auto start = std::chrono::steady_clock::now();
    auto devices = scanner.Scan(50ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(devices.empty());
    EXPECT_GE(elapsed, 50ms);
    EXPECT_LT(elapsed, 5s);
    EXPECT_EQ(adapter->Count("start_scan"), 1u);
    EXPECT_EQ(adapter->Count("stop_scan"), 1u);
}

TEST(DeviceScanner, NoMatchesIsEmpty) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->advertisements = {
        Advertisement("00:00:00:00:00:01", std::string("Living Room TV"), -50),
        Advertisement("00:00:00:00:00:02", std::string("Speaker"), -50),
    };
    EXPECT_TRUE(DeviceScanner(adapter).Scan(10ms).empty());
}

TEST(DeviceScanner, RefusedScanIsEmpty) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->scan_status = BleStatus::NotSupported;
    adapter->advertisements = { Advertisement("00:00:00:00:00:01", std::string("Polar H10"), -50) };

    auto devices = DeviceScanner(adapter).Scan(10ms);

    EXPECT_TRUE(devices.empty());
    EXPECT_EQ(adapter->Count("stop_scan"), 0u);
}

TEST(DeviceScanner, RepeatedAdvertisementsAreMerged) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->advertisements = {
        Advertisement("00:00:00:00:00:01", std::nullopt, -90),
        Advertisement("00:00:00:00:00:01", std::string("Mi"), -70),
        Advertisement("00:00:00:00:00:01", std::string("Mi Smart Band 7"), -55),
        Advertisement("00:00:00:00:00:01", std::nullopt, -50),
    };

    auto devices = DeviceScanner(adapter).Scan(10ms);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(*devices[0].name, "Mi Smart Band 7");
    EXPECT_EQ(devices[0].rssi, -50);
}

TEST(DeviceScanner, CustomKeywords) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    adapter->advertisements = {
        Advertisement("00:00:00:00:00:01", std::string("Wellue O2Ring Oximeter"), -50),
        Advertisement("00:00:00:00:00:02", std::string("Polar H10"), -40),
    };

    DeviceScanner scanner(adapter, { "OXIMETER" });
    auto devices = scanner.Scan(10ms);

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].address, "00:00:00:00:00:01");
}

TEST(DeviceScanner, MatchesIsCaseInsensitive) {
    auto adapter = std::make_shared<FakeBleAdapter>();
    DeviceScanner scanner(adapter);

    EXPECT_TRUE(scanner.Matches(Advertisement("x", std::string("pOlAr"), 0)));
    EXPECT_TRUE(scanner.Matches(Advertisement("x", std::string("Apple Watch"), 0)));
    EXPECT_FALSE(scanner.Matches(Advertisement("x", std::string("Keyboard"), 0)));
    EXPECT_FALSE(scanner.Matches(Advertisement("x", std::nullopt, 0)));
}

TEST(DeviceScanner, DefaultKeywords) {
    const auto& keywords = DeviceScanner::DefaultKeywords();
    EXPECT_EQ(keywords.size(), 9u);
    EXPECT_NE(std::find(keywords.begin(), keywords.end(), "polar"), keywords.end());
    EXPECT_NE(std::find(keywords.begin(), keywords.end(), "huawei"), keywords.end());
}
