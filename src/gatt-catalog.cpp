#include "gatt-catalog.hpp"

#include <cstdio>

static const std::array<GattServiceEntry, kServiceKindCount> kKnownServices = {{
    { ServiceKind::HeartRate,         0x180d, 0x2a37, false }, // Heart Rate Measurement
    { ServiceKind::HealthThermometer, 0x1809, 0x2a1c, false }, // Temperature Measurement
    { ServiceKind::BloodPressure,     0x1810, 0x2a35, false }, // Blood Pressure Measurement
    { ServiceKind::PulseOximeter,     0x1822, 0x2a5f, false }, // PLX Continuous Measurement
    { ServiceKind::Battery,           0x180f, 0x2a19, true  }, // Battery Level
}};

const std::array<GattServiceEntry, kServiceKindCount>& KnownServices() {
    return kKnownServices;
}

const GattServiceEntry& ServiceEntry(ServiceKind kind) {
    return kKnownServices[static_cast<size_t>(kind)];
}

std::optional<ServiceKind> ServiceKindForUuid(uint16_t service_uuid) {
    for (const auto& entry : kKnownServices) {
        if (entry.service_uuid == service_uuid) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

std::string FormatSigUuid(uint16_t short_uuid) {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "0000%04x-0000-1000-8000-00805f9b34fb", short_uuid);
    return buf;
}
