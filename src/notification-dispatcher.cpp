#include "notification-dispatcher.hpp"
#include "characteristic-decoders.hpp"
#include "gatt-catalog.hpp"

#include <util/base.h>

#include <utility>
#include <vector>

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<BleAdapter> adapter,
                                               std::shared_ptr<VitalsStore> store)
    : adapter_(std::move(adapter)), store_(std::move(store)) {}

Status NotificationDispatcher::Subscribe(ServiceKind kind) {
    const GattServiceEntry& entry = ServiceEntry(kind);
    const size_t index = static_cast<size_t>(kind);

    bool had_previous = false;
    uint64_t generation = 0;
    {
        // Waits for an in-flight value of the previous subscription.
        std::lock_guard<std::mutex> kind_lock(kind_mutex_[index]);
        std::lock_guard<std::mutex> lock(mutex_);
        had_previous = active_[index] != 0;
        generation = next_generation_++;
        // Set before the adapter call; the first value may arrive immediately.
        active_[index] = generation;
    }
    if (had_previous) {
        blog(LOG_INFO, "Replacing %s subscription", ServiceKindName(kind));
        adapter_->Unsubscribe(entry.service_uuid, entry.characteristic_uuid);
    }

    std::weak_ptr<NotificationDispatcher> weak = weak_from_this();
    BleStatus status = adapter_->Subscribe(
        entry.service_uuid, entry.characteristic_uuid,
        [weak, kind, generation](const std::vector<uint8_t>& value) {
            if (auto self = weak.lock()) {
                self->Deliver(RawNotification{ kind, value, std::chrono::system_clock::now() },
                              generation);
            }
        });

    if (status != BleStatus::Success) {
        {
            std::lock_guard<std::mutex> kind_lock(kind_mutex_[index]);
            std::lock_guard<std::mutex> lock(mutex_);
            if (active_[index] == generation) {
                active_[index] = 0;
            }
        }
        return Status::Fail(VitalsError::ServiceUnavailable,
                            std::string("subscribe to ") + FormatSigUuid(entry.characteristic_uuid) +
                                " failed: " + BleStatusName(status));
    }

    blog(LOG_INFO, "Subscribed to %s notifications", ServiceKindName(kind));
    return Status::Ok();
}

void NotificationDispatcher::Deliver(const RawNotification& notification, uint64_t generation) {
    const size_t index = static_cast<size_t>(notification.kind);

    // The generation is checked under the kind lock and the lock is held
    // through the store write, so teardown cannot complete in between.
    std::lock_guard<std::mutex> kind_lock(kind_mutex_[index]);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_[index] != generation) {
            blog(LOG_DEBUG, "Dropping %s value from a released subscription",
                 ServiceKindName(notification.kind));
            return;
        }
    }
    // Failures are logged inside DispatchLocked; the subscription stays active.
    (void)DispatchLocked(notification);
}

Status NotificationDispatcher::Dispatch(const RawNotification& notification) {
    std::lock_guard<std::mutex> kind_lock(kind_mutex_[static_cast<size_t>(notification.kind)]);
    return DispatchLocked(notification);
}

Status NotificationDispatcher::DispatchLocked(const RawNotification& notification) {
    const auto& payload = notification.payload;
    const auto timestamp = notification.received_at;

    Status status;
    switch (notification.kind) {
    case ServiceKind::HeartRate: {
        auto bpm = DecodeHeartRate(payload);
        if (!bpm) { status = bpm.status(); break; }
        blog(LOG_DEBUG, "Heart rate: %d bpm", bpm.value());
        store_->SetHeartRate(bpm.value(), timestamp);
        break;
    }
    case ServiceKind::HealthThermometer: {
        auto temperature = DecodeTemperatureF(payload);
        if (!temperature) { status = temperature.status(); break; }
        blog(LOG_DEBUG, "Temperature: %.1f F", temperature.value());
        store_->SetTemperature(temperature.value(), timestamp);
        break;
    }
    case ServiceKind::BloodPressure: {
        auto pressure = DecodeBloodPressure(payload);
        if (!pressure) { status = pressure.status(); break; }
        blog(LOG_DEBUG, "Blood pressure: %d/%d mmHg", pressure.value().systolic,
             pressure.value().diastolic);
        store_->SetBloodPressure(pressure.value().systolic, pressure.value().diastolic, timestamp);
        break;
    }
    case ServiceKind::PulseOximeter: {
        auto spo2 = DecodeOxygenSaturation(payload);
        if (!spo2) { status = spo2.status(); break; }
        blog(LOG_DEBUG, "Oxygen saturation: %d%%", spo2.value());
        store_->SetOxygenSaturation(spo2.value(), timestamp);
        break;
    }
    case ServiceKind::Battery: {
        auto level = DecodeBatteryLevel(payload);
        if (!level) { status = level.status(); break; }
        blog(LOG_DEBUG, "Battery level: %d%%", level.value());
        store_->SetBatteryLevel(level.value(), timestamp);
        break;
    }
    }

    if (!status) {
        blog(LOG_WARNING, "Ignoring malformed %s value (%zu bytes): %s",
             ServiceKindName(notification.kind), payload.size(), status.message().c_str());
    }
    return status;
}

void NotificationDispatcher::UnsubscribeAll() {
    std::vector<ServiceKind> released;
    for (const auto& entry : KnownServices()) {
        if (ClearGeneration(entry.kind)) {
            released.push_back(entry.kind);
        }
    }

    for (ServiceKind kind : released) {
        const GattServiceEntry& entry = ServiceEntry(kind);
        adapter_->Unsubscribe(entry.service_uuid, entry.characteristic_uuid);
        blog(LOG_INFO, "Unsubscribed from %s notifications", ServiceKindName(kind));
    }
}

void NotificationDispatcher::ReleaseAll() {
    for (const auto& entry : KnownServices()) {
        ClearGeneration(entry.kind);
    }
}

bool NotificationDispatcher::ClearGeneration(ServiceKind kind) {
    const size_t index = static_cast<size_t>(kind);
    std::lock_guard<std::mutex> kind_lock(kind_mutex_[index]);
    std::lock_guard<std::mutex> lock(mutex_);
    if (active_[index] == 0) return false;
    active_[index] = 0;
    return true;
}

bool NotificationDispatcher::IsSubscribed(ServiceKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_[static_cast<size_t>(kind)] != 0;
}
