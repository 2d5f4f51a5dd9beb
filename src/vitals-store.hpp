#pragma once
#include "vitals-types.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

using VitalsCallback = std::function<void(const VitalsSnapshot& snapshot,
                                          std::chrono::system_clock::time_point timestamp)>;

// Latest decoded value per vital. Every setter publishes a full copy of the
// snapshot to the observers after the state lock is released. Publications
// are serialized, so the last snapshot an observer receives is the current one.
class VitalsStore {
public:
    using SubscriptionId = uint64_t;

    VitalsSnapshot GetSnapshot() const;

    void SetHeartRate(int bpm, std::chrono::system_clock::time_point timestamp);
    void SetTemperature(double fahrenheit, std::chrono::system_clock::time_point timestamp);
    void SetBloodPressure(int systolic, int diastolic, std::chrono::system_clock::time_point timestamp);
    void SetOxygenSaturation(int percent, std::chrono::system_clock::time_point timestamp);
    void SetBatteryLevel(int percent, std::chrono::system_clock::time_point timestamp);
    void Reset();

    SubscriptionId Subscribe(VitalsCallback callback);
    void Unsubscribe(SubscriptionId id);

private:
    template <typename Mutator>
    void Update(Mutator mutate, std::chrono::system_clock::time_point timestamp);
    void Publish(const VitalsSnapshot& snapshot, std::chrono::system_clock::time_point timestamp);

    std::recursive_mutex publish_mutex_;
    mutable std::mutex mutex_;
    VitalsSnapshot snapshot_;

    std::mutex observers_mutex_;
    std::map<SubscriptionId, VitalsCallback> observers_;
    SubscriptionId next_id_ = 1;
};
