#include "vitals-store.hpp"

#include <utility>
#include <vector>

VitalsSnapshot VitalsStore::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

template <typename Mutator>
void VitalsStore::Update(Mutator mutate, std::chrono::system_clock::time_point timestamp) {
    // Held through publication so observers see updates in the order they
    // were applied. Recursive so an observer may call a setter.
    std::lock_guard<std::recursive_mutex> publish_lock(publish_mutex_);
    VitalsSnapshot copy;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        mutate(snapshot_);
        copy = snapshot_;
    }
    Publish(copy, timestamp);
}

void VitalsStore::SetHeartRate(int bpm, std::chrono::system_clock::time_point timestamp) {
    Update([bpm](VitalsSnapshot& s) { s.heart_rate_bpm = bpm; }, timestamp);
}

void VitalsStore::SetTemperature(double fahrenheit, std::chrono::system_clock::time_point timestamp) {
    Update([fahrenheit](VitalsSnapshot& s) { s.temperature_f = fahrenheit; }, timestamp);
}

void VitalsStore::SetBloodPressure(int systolic, int diastolic,
                                   std::chrono::system_clock::time_point timestamp) {
    Update([systolic, diastolic](VitalsSnapshot& s) {
        s.blood_pressure_systolic = systolic;
        s.blood_pressure_diastolic = diastolic;
    }, timestamp);
}

void VitalsStore::SetOxygenSaturation(int percent, std::chrono::system_clock::time_point timestamp) {
    Update([percent](VitalsSnapshot& s) { s.oxygen_saturation_pct = percent; }, timestamp);
}

void VitalsStore::SetBatteryLevel(int percent, std::chrono::system_clock::time_point timestamp) {
    Update([percent](VitalsSnapshot& s) { s.battery_pct = percent; }, timestamp);
}

void VitalsStore::Reset() {
    Update([](VitalsSnapshot& s) { s = VitalsSnapshot(); }, std::chrono::system_clock::now());
}

VitalsStore::SubscriptionId VitalsStore::Subscribe(VitalsCallback callback) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    SubscriptionId id = next_id_++;
    observers_.emplace(id, std::move(callback));
    return id;
}

void VitalsStore::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(observers_mutex_);
    observers_.erase(id);
}

void VitalsStore::Publish(const VitalsSnapshot& snapshot,
                          std::chrono::system_clock::time_point timestamp) {
    // Copy so observers may (un)subscribe from inside their callback.
    std::vector<VitalsCallback> observers;
    {
        std::lock_guard<std::mutex> lock(observers_mutex_);
        observers.reserve(observers_.size());
        for (const auto& entry : observers_) {
            observers.push_back(entry.second);
        }
    }
    for (const auto& observer : observers) {
        observer(snapshot, timestamp);
    }
}
