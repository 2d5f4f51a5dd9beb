#pragma once
#include "vitals-types.hpp"

#include <cstdint>
#include <vector>

// IEEE-11073 FLOAT (24-bit mantissa, 8-bit exponent) and SFLOAT
// (12-bit mantissa, 4-bit exponent), both value = mantissa * 10^exponent.
struct Ieee11073Number {
    int32_t mantissa = 0;
    int32_t exponent = 0;

    // NaN, NRes, +/-INFINITY and the reserved value of the given format.
    bool IsSpecial(bool short_float) const;
    double ToDouble() const;
};

Ieee11073Number SplitFloat(uint32_t raw);
Ieee11073Number SplitSFloat(uint16_t raw);
uint32_t JoinFloat(int32_t mantissa, int32_t exponent);
uint16_t JoinSFloat(int32_t mantissa, int32_t exponent);

struct BloodPressureReading {
    int systolic = 0;
    int diastolic = 0;
};

Result<int> DecodeHeartRate(const std::vector<uint8_t>& payload);
Result<double> DecodeTemperatureF(const std::vector<uint8_t>& payload);
Result<BloodPressureReading> DecodeBloodPressure(const std::vector<uint8_t>& payload);
Result<int> DecodeOxygenSaturation(const std::vector<uint8_t>& payload);
Result<int> DecodeBatteryLevel(const std::vector<uint8_t>& payload);
