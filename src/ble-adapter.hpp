#pragma once
#include "vitals-types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

enum class BleStatus {
    Success,
    Timeout,
    Refused,
    Unreachable,
    NotSupported,
    Failed,
};

const char* BleStatusName(BleStatus status);

using AdvertisementCallback = std::function<void(const DeviceAdvertisement& advertisement)>;
using ValueChangedCallback = std::function<void(const std::vector<uint8_t>& value)>;
using LinkLostCallback = std::function<void()>;

// Host BLE adapter. Calls block until the platform completes or gives up.
// Value callbacks for one characteristic are delivered one at a time and may
// run on a platform thread.
class BleAdapter {
public:
    virtual ~BleAdapter() = default;

    virtual BleStatus StartScan(AdvertisementCallback callback) = 0;
    virtual void StopScan() = 0;

    virtual BleStatus Connect(const std::string& address) = 0;
    virtual void Disconnect() = 0;
    virtual bool IsConnected() const = 0;

    // Short (16-bit) UUIDs of the primary services of the connected peripheral.
    virtual std::vector<uint16_t> DiscoverServices() = 0;

    virtual BleStatus ReadCharacteristic(uint16_t service_uuid, uint16_t characteristic_uuid,
                                         std::vector<uint8_t>& value) = 0;
    virtual BleStatus Subscribe(uint16_t service_uuid, uint16_t characteristic_uuid,
                                ValueChangedCallback callback) = 0;
    virtual void Unsubscribe(uint16_t service_uuid, uint16_t characteristic_uuid) = 0;

    virtual void SetLinkLostCallback(LinkLostCallback callback) = 0;

    static std::shared_ptr<BleAdapter> Create();
};
