#include "gatt-catalog.hpp"

#include <gtest/gtest.h>

#include <set>

TEST(GattCatalog, OneEntryPerKind) {
    std::set<ServiceKind> kinds;
    for (const auto& entry : KnownServices()) {
        kinds.insert(entry.kind);
        EXPECT_EQ(&ServiceEntry(entry.kind), &entry);
    }
    EXPECT_EQ(kinds.size(), kServiceKindCount);
}

TEST(GattCatalog, AssignedNumbers) {
    EXPECT_EQ(ServiceEntry(ServiceKind::HeartRate).service_uuid, 0x180d);
    EXPECT_EQ(ServiceEntry(ServiceKind::HeartRate).characteristic_uuid, 0x2a37);
    EXPECT_EQ(ServiceEntry(ServiceKind::HealthThermometer).characteristic_uuid, 0x2a1c);
    EXPECT_EQ(ServiceEntry(ServiceKind::BloodPressure).service_uuid, 0x1810);
    EXPECT_EQ(ServiceEntry(ServiceKind::PulseOximeter).characteristic_uuid, 0x2a5f);
    EXPECT_TRUE(ServiceEntry(ServiceKind::Battery).readable);
    EXPECT_FALSE(ServiceEntry(ServiceKind::HeartRate).readable);
}

TEST(GattCatalog, LookupByServiceUuid) {
    EXPECT_EQ(ServiceKindForUuid(0x1809), ServiceKind::HealthThermometer);
    EXPECT_EQ(ServiceKindForUuid(0x180f), ServiceKind::Battery);
    EXPECT_FALSE(ServiceKindForUuid(kGenericAccessService));
    EXPECT_FALSE(ServiceKindForUuid(0x2a37));
}

TEST(GattCatalog, FormatsFullUuid) {
    EXPECT_EQ(FormatSigUuid(0x2a37), "00002a37-0000-1000-8000-00805f9b34fb");
}
