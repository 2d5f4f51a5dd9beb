#pragma once
#include "vitals-types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>

// Bluetooth SIG assigned numbers, expanded onto the base UUID
// 0000xxxx-0000-1000-8000-00805f9b34fb by the adapters.
constexpr uint16_t kGenericAccessService = 0x1800;
constexpr uint16_t kDeviceNameCharacteristic = 0x2a00;

struct GattServiceEntry {
    ServiceKind kind;
    uint16_t service_uuid;
    uint16_t characteristic_uuid;
    bool readable; // value can also be fetched with a plain read
};

const std::array<GattServiceEntry, kServiceKindCount>& KnownServices();

const GattServiceEntry& ServiceEntry(ServiceKind kind);
std::optional<ServiceKind> ServiceKindForUuid(uint16_t service_uuid);

std::string FormatSigUuid(uint16_t short_uuid);
