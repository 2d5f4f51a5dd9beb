#define WIN32_LEAN_AND_MEAN
#include <windows.h>
#include "ble-adapter.hpp"
#include "gatt-catalog.hpp"
#include <obs-module.h>

#include <winrt/Windows.Foundation.h>
#include <winrt/Windows.Foundation.Collections.h>
#include <winrt/Windows.Devices.Bluetooth.h>
#include <winrt/Windows.Devices.Bluetooth.Advertisement.h>
#include <winrt/Windows.Devices.Bluetooth.GenericAttributeProfile.h>
#include <winrt/Windows.Storage.Streams.h>

#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

using namespace winrt;
using namespace Windows::Foundation;
using namespace Windows::Devices::Bluetooth;
using namespace Windows::Devices::Bluetooth::Advertisement;
using namespace Windows::Devices::Bluetooth::GenericAttributeProfile;
using namespace Windows::Storage::Streams;

static constexpr std::chrono::seconds kConnectTimeout{ 10 };
static constexpr std::chrono::seconds kGattTimeout{ 5 };
static constexpr std::chrono::seconds kCccdTimeout{ 1 };

// Helper to check for valid UTF-8
static bool IsValidUtf8(const std::vector<uint8_t>& data) {
    int n;
    for (size_t i = 0; i < data.size(); ++i) {
        if ((data[i] & 0x80) == 0) {
            n = 0;
        } else if ((data[i] & 0xE0) == 0xC0) {
            n = 1;
        } else if ((data[i] & 0xF0) == 0xE0) {
            n = 2;
        } else if ((data[i] & 0xF8) == 0xF0) {
            n = 3;
        } else {
            return false;
        }
        for (int j = 0; j < n; ++j) {
            if (++i == data.size() || (data[i] & 0xC0) != 0x80) {
                return false;
            }
        }
    }
    return true;
}

// Helper to convert Bytes (likely GBK) to UTF-8
static std::string BytesToUtf8(const std::vector<uint8_t>& bytes, UINT codepage) {
    if (bytes.empty()) return "";
    int len = MultiByteToWideChar(codepage, 0, (LPCSTR)bytes.data(), (int)bytes.size(), NULL, 0);
    if (len <= 0) return "";
    std::wstring wstr(len, 0);
    MultiByteToWideChar(codepage, 0, (LPCSTR)bytes.data(), (int)bytes.size(), &wstr[0], len);
    return to_string(wstr);
}

static void TrimRawBytes(std::vector<uint8_t>& bytes) {
    while (!bytes.empty() && (bytes.back() == 0x00 || bytes.back() == 0xFF)) {
        bytes.pop_back();
    }
}

static std::vector<uint8_t> ReadAll(IBuffer const& buffer) {
    auto reader = DataReader::FromBuffer(buffer);
    std::vector<uint8_t> bytes(reader.UnconsumedBufferLength());
    if (!bytes.empty()) {
        reader.ReadBytes(bytes);
    }
    return bytes;
}

// 0000xxxx-0000-1000-8000-00805f9b34fb
static guid SigUuid(uint16_t short_uuid) {
    return { short_uuid, 0x0000, 0x1000, { 0x80, 0x00, 0x00, 0x80, 0x5f, 0x9b, 0x34, 0xfb } };
}

static std::optional<uint16_t> ShortUuid(guid const& uuid) {
    if (uuid.Data1 > 0xffff) return std::nullopt;
    if (SigUuid(static_cast<uint16_t>(uuid.Data1)) != uuid) return std::nullopt;
    return static_cast<uint16_t>(uuid.Data1);
}

static std::string FormatAddress(uint64_t address) {
    char buf[18];
    std::snprintf(buf, sizeof(buf), "%02X:%02X:%02X:%02X:%02X:%02X",
                  (unsigned)((address >> 40) & 0xff), (unsigned)((address >> 32) & 0xff),
                  (unsigned)((address >> 24) & 0xff), (unsigned)((address >> 16) & 0xff),
                  (unsigned)((address >> 8) & 0xff), (unsigned)(address & 0xff));
    return buf;
}

static bool ParseAddress(const std::string& text, uint64_t& address) {
    unsigned b[6];
    char tail;
    if (std::sscanf(text.c_str(), "%2x:%2x:%2x:%2x:%2x:%2x%c", &b[0], &b[1], &b[2], &b[3], &b[4],
                    &b[5], &tail) != 6) {
        return false;
    }
    address = 0;
    for (unsigned byte : b) {
        address = (address << 8) | (byte & 0xff);
    }
    return true;
}

static BleStatus FromGattStatus(GattCommunicationStatus status) {
    switch (status) {
    case GattCommunicationStatus::Success: return BleStatus::Success;
    case GattCommunicationStatus::Unreachable: return BleStatus::Unreachable;
    case GattCommunicationStatus::AccessDenied: return BleStatus::Refused;
    default: return BleStatus::Failed;
    }
}

// Blocks on a WinRT async operation. Must not run on an STA thread.
template <typename Operation>
static BleStatus Await(Operation const& op, std::chrono::seconds timeout) {
    AsyncStatus status = op.wait_for(timeout);
    if (status == AsyncStatus::Started) {
        op.Cancel();
        return BleStatus::Timeout;
    }
    return status == AsyncStatus::Completed ? BleStatus::Success : BleStatus::Failed;
}

class BleAdapterWinRT : public BleAdapter {
    struct ActiveSubscription {
        GattCharacteristic characteristic{ nullptr };
        event_token token;
    };

    BluetoothLEAdvertisementWatcher watcher_{ nullptr };
    BluetoothLEDevice device_{ nullptr };
    std::map<uint16_t, GattDeviceService> services_;
    std::map<uint16_t, ActiveSubscription> subscriptions_; // by characteristic
    event_token connection_status_token_;

    AdvertisementCallback scan_callback_;
    LinkLostCallback link_lost_callback_;

    mutable std::mutex mutex_;
    bool is_scanning_ = false;

public:
    BleAdapterWinRT() {
        watcher_ = BluetoothLEAdvertisementWatcher();
        watcher_.ScanningMode(BluetoothLEScanningMode::Active);

        watcher_.Received([this](BluetoothLEAdvertisementWatcher const&,
                                 BluetoothLEAdvertisementReceivedEventArgs const& args) {
            DeviceAdvertisement adv;
            adv.address = FormatAddress(args.BluetoothAddress());
            adv.rssi = args.RawSignalStrengthInDBm();

            // Decode the name by hand to handle GBK/garbled text
            std::string name;
            for (auto section : args.Advertisement().DataSections()) {
                uint8_t type = section.DataType();
                if (type != 0x09 && type != 0x08) continue; // Complete or Shortened Local Name

                std::vector<uint8_t> bytes = ReadAll(section.Data());
                TrimRawBytes(bytes);
                if (bytes.empty()) continue;

                std::string s = IsValidUtf8(bytes) ? std::string(bytes.begin(), bytes.end())
                                                   : BytesToUtf8(bytes, 936); // GBK
                if (!s.empty() && (name.empty() || type == 0x09)) {
                    name = s;
                }
            }
            if (name.empty()) {
                name = to_string(args.Advertisement().LocalName());
            }
            if (!name.empty()) {
                adv.name = name;
            }

            AdvertisementCallback callback;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                callback = scan_callback_;
            }
            if (callback) {
                callback(adv);
            }
        });
    }

    ~BleAdapterWinRT() {
        StopScan();
        Disconnect();
    }

    BleStatus StartScan(AdvertisementCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        scan_callback_ = std::move(callback);
        if (!is_scanning_) {
            try {
                watcher_.Start();
                is_scanning_ = true;
            } catch (hresult_error const& e) {
                blog(LOG_WARNING, "Failed to start BLE watcher: %s", to_string(e.message()).c_str());
                scan_callback_ = nullptr;
                return BleStatus::Refused;
            }
        }
        return BleStatus::Success;
    }

    void StopScan() override {
        std::lock_guard<std::mutex> lock(mutex_);
        scan_callback_ = nullptr;
        if (is_scanning_) {
            watcher_.Stop();
            is_scanning_ = false;
        }
    }

    BleStatus Connect(const std::string& address_str) override {
        uint64_t address = 0;
        if (!ParseAddress(address_str, address)) {
            blog(LOG_WARNING, "Invalid device address: %s", address_str.c_str());
            return BleStatus::Unreachable;
        }

        Disconnect();

        try {
            blog(LOG_INFO, "Connecting to device address: %s", address_str.c_str());
            auto device_op = BluetoothLEDevice::FromBluetoothAddressAsync(address);
            BleStatus status = Await(device_op, kConnectTimeout);
            if (status != BleStatus::Success) return status;

            BluetoothLEDevice device = device_op.GetResults();
            if (!device) {
                blog(LOG_WARNING, "Failed to get device object");
                return BleStatus::Unreachable;
            }

            // An uncached service query brings the link up.
            blog(LOG_INFO, "Discovering services...");
            auto services_op = device.GetGattServicesAsync(BluetoothCacheMode::Uncached);
            status = Await(services_op, kConnectTimeout);
            if (status != BleStatus::Success) {
                device.Close();
                return status;
            }

            auto result = services_op.GetResults();
            if (result.Status() != GattCommunicationStatus::Success) {
                blog(LOG_WARNING, "Failed to get services. Status: %d", (int)result.Status());
                device.Close();
                return FromGattStatus(result.Status());
            }

            std::map<uint16_t, GattDeviceService> services;
            for (auto service : result.Services()) {
                auto short_uuid = ShortUuid(service.Uuid());
                if (short_uuid) {
                    services.emplace(*short_uuid, service);
                } else {
                    service.Close();
                }
            }

            std::lock_guard<std::mutex> lock(mutex_);
            device_ = device;
            services_ = std::move(services);
            connection_status_token_ =
                device.ConnectionStatusChanged({ this, &BleAdapterWinRT::OnConnectionStatusChanged });
            return BleStatus::Success;
        } catch (hresult_error const& e) {
            blog(LOG_ERROR, "Connecting to %s failed: %s", address_str.c_str(),
                 to_string(e.message()).c_str());
            return BleStatus::Failed;
        }
    }

    void Disconnect() override {
        std::vector<uint16_t> characteristics;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& entry : subscriptions_) {
                characteristics.push_back(entry.first);
            }
        }
        for (uint16_t characteristic : characteristics) {
            Unsubscribe(0, characteristic);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (device_) {
            if (connection_status_token_.value != 0) {
                device_.ConnectionStatusChanged(connection_status_token_);
                connection_status_token_ = {};
            }

            for (auto& entry : services_) {
                entry.second.Close();
            }
            services_.clear();

            device_.Close();
            device_ = nullptr;
        }
    }

    bool IsConnected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!device_) return false;
        try {
            return device_.ConnectionStatus() == BluetoothConnectionStatus::Connected;
        } catch (hresult_error const& e) {
            blog(LOG_WARNING, "Connection status unavailable: %s", to_string(e.message()).c_str());
            return false;
        }
    }

    std::vector<uint16_t> DiscoverServices() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<uint16_t> uuids;
        for (const auto& entry : services_) {
            uuids.push_back(entry.first);
        }
        return uuids;
    }

    BleStatus ReadCharacteristic(uint16_t service_uuid, uint16_t characteristic_uuid,
                                 std::vector<uint8_t>& value) override {
        // Windows keeps the GAP service to itself; the name is on the device object.
        if (service_uuid == kGenericAccessService && characteristic_uuid == kDeviceNameCharacteristic) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!device_) return BleStatus::Unreachable;
            std::string name = to_string(device_.Name());
            if (name.empty()) return BleStatus::NotSupported;
            value.assign(name.begin(), name.end());
            return BleStatus::Success;
        }

        try {
            GattCharacteristic characteristic{ nullptr };
            BleStatus status = FindCharacteristic(service_uuid, characteristic_uuid, characteristic);
            if (status != BleStatus::Success) return status;

            auto properties = characteristic.CharacteristicProperties();
            if ((properties & GattCharacteristicProperties::Read) == GattCharacteristicProperties::None) {
                return BleStatus::NotSupported;
            }

            auto op = characteristic.ReadValueAsync(BluetoothCacheMode::Uncached);
            status = Await(op, kGattTimeout);
            if (status != BleStatus::Success) return status;

            auto result = op.GetResults();
            if (result.Status() != GattCommunicationStatus::Success) {
                return FromGattStatus(result.Status());
            }
            value = ReadAll(result.Value());
            return BleStatus::Success;
        } catch (hresult_error const& e) {
            blog(LOG_WARNING, "Reading %s failed: %s", FormatSigUuid(characteristic_uuid).c_str(),
                 to_string(e.message()).c_str());
            return BleStatus::Failed;
        }
    }

    BleStatus Subscribe(uint16_t service_uuid, uint16_t characteristic_uuid,
                        ValueChangedCallback callback) override {
        Unsubscribe(service_uuid, characteristic_uuid);

        try {
            GattCharacteristic characteristic{ nullptr };
            BleStatus status = FindCharacteristic(service_uuid, characteristic_uuid, characteristic);
            if (status != BleStatus::Success) return status;

            // Measurements use notify, blood pressure and temperature usually indicate.
            auto properties = characteristic.CharacteristicProperties();
            GattClientCharacteristicConfigurationDescriptorValue cccd;
            if ((properties & GattCharacteristicProperties::Notify) != GattCharacteristicProperties::None) {
                cccd = GattClientCharacteristicConfigurationDescriptorValue::Notify;
            } else if ((properties & GattCharacteristicProperties::Indicate) !=
                       GattCharacteristicProperties::None) {
                cccd = GattClientCharacteristicConfigurationDescriptorValue::Indicate;
            } else {
                blog(LOG_WARNING, "Characteristic %s supports neither notify nor indicate",
                     FormatSigUuid(characteristic_uuid).c_str());
                return BleStatus::NotSupported;
            }

            auto op = characteristic.WriteClientCharacteristicConfigurationDescriptorAsync(cccd);
            status = Await(op, kGattTimeout);
            if (status != BleStatus::Success) return status;
            if (op.GetResults() != GattCommunicationStatus::Success) {
                blog(LOG_WARNING, "Failed to subscribe. Status: %d", (int)op.GetResults());
                return FromGattStatus(op.GetResults());
            }

            std::lock_guard<std::mutex> lock(mutex_);
            ActiveSubscription subscription;
            subscription.characteristic = characteristic;
            subscription.token = characteristic.ValueChanged(
                [callback](GattCharacteristic const&, GattValueChangedEventArgs const& args) {
                    callback(ReadAll(args.CharacteristicValue()));
                });
            subscriptions_[characteristic_uuid] = subscription;
            return BleStatus::Success;
        } catch (hresult_error const& e) {
            blog(LOG_WARNING, "Subscribing to %s failed: %s", FormatSigUuid(characteristic_uuid).c_str(),
                 to_string(e.message()).c_str());
            return BleStatus::Failed;
        }
    }

    void Unsubscribe(uint16_t, uint16_t characteristic_uuid) override {
        ActiveSubscription subscription;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = subscriptions_.find(characteristic_uuid);
            if (it == subscriptions_.end()) return;
            subscription = it->second;
            subscriptions_.erase(it);
        }

        try {
            subscription.characteristic.ValueChanged(subscription.token);

            // Write None to the CCCD so the device stops sending
            auto op = subscription.characteristic.WriteClientCharacteristicConfigurationDescriptorAsync(
                GattClientCharacteristicConfigurationDescriptorValue::None);
            // Bounded wait so shutdown never hangs on a dead link
            if (op.wait_for(kCccdTimeout) != AsyncStatus::Completed) {
                op.Cancel();
            }
        } catch (hresult_error const& e) {
            blog(LOG_DEBUG, "Clearing CCCD of %s failed: %s", FormatSigUuid(characteristic_uuid).c_str(),
                 to_string(e.message()).c_str());
        }
    }

    void SetLinkLostCallback(LinkLostCallback callback) override {
        std::lock_guard<std::mutex> lock(mutex_);
        link_lost_callback_ = std::move(callback);
    }

private:
    BleStatus FindCharacteristic(uint16_t service_uuid, uint16_t characteristic_uuid,
                                 GattCharacteristic& characteristic) {
        GattDeviceService service{ nullptr };
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!device_) return BleStatus::Unreachable;
            auto it = services_.find(service_uuid);
            if (it == services_.end()) return BleStatus::NotSupported;
            service = it->second;
        }

        auto op = service.GetCharacteristicsForUuidAsync(SigUuid(characteristic_uuid));
        BleStatus status = Await(op, kGattTimeout);
        if (status != BleStatus::Success) return status;

        auto result = op.GetResults();
        if (result.Status() != GattCommunicationStatus::Success) {
            blog(LOG_WARNING, "Failed to get characteristics. Status: %d", (int)result.Status());
            return FromGattStatus(result.Status());
        }
        auto chars = result.Characteristics();
        if (chars.Size() == 0) {
            return BleStatus::NotSupported;
        }
        characteristic = chars.GetAt(0);
        return BleStatus::Success;
    }

    void OnConnectionStatusChanged(BluetoothLEDevice const& sender, IInspectable const&) {
        if (sender.ConnectionStatus() != BluetoothConnectionStatus::Disconnected) return;

        LinkLostCallback callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!device_ || device_ != sender) return;
            callback = link_lost_callback_;
        }
        blog(LOG_INFO, "Device %s reported disconnect", FormatAddress(sender.BluetoothAddress()).c_str());
        if (callback) {
            callback();
        }
    }
};

std::shared_ptr<BleAdapter> BleAdapter::Create() {
    return std::make_shared<BleAdapterWinRT>();
}
