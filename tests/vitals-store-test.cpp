#include "vitals-store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

using Clock = std::chrono::system_clock;

TEST(VitalsStore, EmptyUntilWritten) {
    VitalsStore store;
    VitalsSnapshot snapshot = store.GetSnapshot();
    EXPECT_FALSE(snapshot.heart_rate_bpm);
    EXPECT_FALSE(snapshot.temperature_f);
    EXPECT_FALSE(snapshot.blood_pressure_systolic);
    EXPECT_FALSE(snapshot.blood_pressure_diastolic);
    EXPECT_FALSE(snapshot.oxygen_saturation_pct);
    EXPECT_FALSE(snapshot.battery_pct);
}

TEST(VitalsStore, ZeroIsNotAbsent) {
    VitalsStore store;
    store.SetBatteryLevel(0, Clock::now());
    VitalsSnapshot snapshot = store.GetSnapshot();
    ASSERT_TRUE(snapshot.battery_pct);
    EXPECT_EQ(*snapshot.battery_pct, 0);
    EXPECT_FALSE(snapshot.heart_rate_bpm);
}

TEST(VitalsStore, SnapshotIsACopy) {
    VitalsStore store;
    VitalsSnapshot before = store.GetSnapshot();
    store.SetHeartRate(80, Clock::now());
    EXPECT_FALSE(before.heart_rate_bpm);
    EXPECT_EQ(store.GetSnapshot().heart_rate_bpm, 80);
}

TEST(VitalsStore, LatestValueWins) {
    VitalsStore store;
    store.SetTemperature(98.6, Clock::now());
    store.SetTemperature(99.1, Clock::now());
    store.SetOxygenSaturation(97, Clock::now());
    VitalsSnapshot snapshot = store.GetSnapshot();
    EXPECT_DOUBLE_EQ(*snapshot.temperature_f, 99.1);
    EXPECT_EQ(snapshot.oxygen_saturation_pct, 97);
}

TEST(VitalsStore, EveryObserverGetsTheFullSnapshot) {
    VitalsStore store;
    store.SetHeartRate(70, Clock::now());

    std::vector<VitalsSnapshot> first, second;
    Clock::time_point seen_at;
    store.Subscribe([&](const VitalsSnapshot& s, Clock::time_point t) {
        first.push_back(s);
        seen_at = t;
    });
    store.Subscribe([&](const VitalsSnapshot& s, Clock::time_point) { second.push_back(s); });

    auto timestamp = Clock::now();
    store.SetBloodPressure(120, 80, timestamp);

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0].heart_rate_bpm, 70);
    EXPECT_EQ(first[0].blood_pressure_systolic, 120);
    EXPECT_EQ(first[0].blood_pressure_diastolic, 80);
    EXPECT_EQ(second[0].blood_pressure_diastolic, 80);
    EXPECT_EQ(seen_at, timestamp);
}

TEST(VitalsStore, UnsubscribeStopsDelivery) {
    VitalsStore store;
    int calls = 0;
    auto id = store.Subscribe([&](const VitalsSnapshot&, Clock::time_point) { ++calls; });
    store.SetHeartRate(60, Clock::now());
    store.Unsubscribe(id);
    store.SetHeartRate(61, Clock::now());
    EXPECT_EQ(calls, 1);

    // Unknown ids are ignored.
    store.Unsubscribe(id);
    store.Unsubscribe(12345);
}

TEST(VitalsStore, ObserverMayUnsubscribeItself) {
    VitalsStore store;
    int calls = 0;
    VitalsStore::SubscriptionId id = 0;
    id = store.Subscribe([&](const VitalsSnapshot&, Clock::time_point) {
        ++calls;
        store.Unsubscribe(id);
    });
    store.SetHeartRate(60, Clock::now());
    store.SetHeartRate(61, Clock::now());
    EXPECT_EQ(calls, 1);
}

TEST(VitalsStore, ObserverMayReadTheStore) {
    VitalsStore store;
    std::optional<int> read_back;
    store.Subscribe([&](const VitalsSnapshot&, Clock::time_point) {
        read_back = store.GetSnapshot().heart_rate_bpm;
    });
    store.SetHeartRate(88, Clock::now());
    EXPECT_EQ(read_back, 88);
}

TEST(VitalsStore, ResetClearsAndNotifies) {
    VitalsStore store;
    store.SetHeartRate(60, Clock::now());
    store.SetBatteryLevel(50, Clock::now());

    std::vector<VitalsSnapshot> seen;
    store.Subscribe([&](const VitalsSnapshot& s, Clock::time_point) { seen.push_back(s); });
    store.Reset();

    VitalsSnapshot snapshot = store.GetSnapshot();
    EXPECT_FALSE(snapshot.heart_rate_bpm);
    EXPECT_FALSE(snapshot.battery_pct);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_FALSE(seen[0].heart_rate_bpm);
}

TEST(VitalsStore, BloodPressureIsNeverTorn) {
    VitalsStore store;
    std::atomic<bool> stop{ false };
    std::atomic<int> torn{ 0 };

    std::thread writer_a([&] {
        while (!stop) store.SetBloodPressure(120, 80, Clock::now());
    });
    std::thread writer_b([&] {
        while (!stop) store.SetBloodPressure(140, 90, Clock::now());
    });

    for (int i = 0; i < 20000; ++i) {
        VitalsSnapshot snapshot = store.GetSnapshot();
        if (!snapshot.blood_pressure_systolic) {
            if (snapshot.blood_pressure_diastolic) ++torn;
            continue;
        }
        int systolic = *snapshot.blood_pressure_systolic;
        int diastolic = snapshot.blood_pressure_diastolic.value_or(-1);
        if (!((systolic == 120 && diastolic == 80) || (systolic == 140 && diastolic == 90))) {
            ++torn;
        }
    }
    stop = true;
    writer_a.join();
    writer_b.join();

    EXPECT_EQ(torn.load(), 0);
}

TEST(VitalsStore, LastPublishedSnapshotIsCurrent) {
    for (int run = 0; run < 200; ++run) {
        VitalsStore store;
        std::mutex seen_mutex;
        VitalsSnapshot last_seen;
        store.Subscribe([&](const VitalsSnapshot& s, Clock::time_point) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            last_seen = s;
        });

        std::thread heart([&] {
            for (int i = 0; i < 50; ++i) store.SetHeartRate(60 + i, Clock::now());
        });
        std::thread temperature([&] {
            for (int i = 0; i < 50; ++i) store.SetTemperature(97.0 + i / 10.0, Clock::now());
        });
        heart.join();
        temperature.join();

        VitalsSnapshot current = store.GetSnapshot();
        std::lock_guard<std::mutex> lock(seen_mutex);
        ASSERT_EQ(last_seen.heart_rate_bpm, current.heart_rate_bpm) << "run " << run;
        ASSERT_EQ(last_seen.temperature_f, current.temperature_f) << "run " << run;
    }
}

TEST(VitalsStore, ObserverMayWriteTheStore) {
    VitalsStore store;
    std::vector<VitalsSnapshot> seen;
    store.Subscribe([&](const VitalsSnapshot& s, Clock::time_point) {
        seen.push_back(s);
        if (!s.battery_pct) store.SetBatteryLevel(50, Clock::now());
    });
    store.SetHeartRate(70, Clock::now());

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1].battery_pct, 50);
    EXPECT_EQ(store.GetSnapshot().battery_pct, 50);
}
