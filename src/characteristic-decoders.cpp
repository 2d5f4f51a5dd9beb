#include "characteristic-decoders.hpp"

#include <cmath>
#include <limits>
#include <string>

static constexpr double kKpaToMmHg = 7.50062;

template <typename T>
static Result<T> TooShort(const char* what, size_t got, size_t need) {
    return Result<T>::Fail(VitalsError::DecodeError,
                           std::string(what) + ": payload has " + std::to_string(got) +
                               " byte(s), need " + std::to_string(need));
}

static uint16_t ReadU16(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

static uint32_t ReadU32(const std::vector<uint8_t>& data, size_t offset) {
    return static_cast<uint32_t>(data[offset]) |
           (static_cast<uint32_t>(data[offset + 1]) << 8) |
           (static_cast<uint32_t>(data[offset + 2]) << 16) |
           (static_cast<uint32_t>(data[offset + 3]) << 24);
}

static double RoundToTenth(double value) {
    return std::round(value * 10.0) / 10.0;
}

// Truncates toward zero; false when the value has no int representation.
static bool ToMmHg(double value, int& out) {
    if (!std::isfinite(value) || value <= static_cast<double>(std::numeric_limits<int>::min()) - 1.0 ||
        value >= static_cast<double>(std::numeric_limits<int>::max()) + 1.0) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool Ieee11073Number::IsSpecial(bool short_float) const {
    if (exponent != 0) return false;
    // Special values sit at the two ends of the mantissa range.
    const int32_t edge = short_float ? 2046 : 8388606;
    return mantissa >= edge || mantissa <= -edge;
}

double Ieee11073Number::ToDouble() const {
    if (exponent >= 0) {
        return mantissa * std::pow(10.0, exponent);
    }
    return mantissa / std::pow(10.0, -exponent);
}

Ieee11073Number SplitFloat(uint32_t raw) {
    Ieee11073Number number;
    number.mantissa = static_cast<int32_t>(raw & 0x00ffffff);
    if (number.mantissa & 0x00800000) {
        number.mantissa -= 0x01000000;
    }
    number.exponent = static_cast<int32_t>((raw >> 24) & 0xff);
    if (number.exponent & 0x80) {
        number.exponent -= 0x100;
    }
    return number;
}

Ieee11073Number SplitSFloat(uint16_t raw) {
    Ieee11073Number number;
    number.mantissa = raw & 0x0fff;
    if (number.mantissa & 0x0800) {
        number.mantissa -= 0x1000;
    }
    number.exponent = (raw >> 12) & 0x0f;
    if (number.exponent & 0x08) {
        number.exponent -= 0x10;
    }
    return number;
}

uint32_t JoinFloat(int32_t mantissa, int32_t exponent) {
    return (static_cast<uint32_t>(exponent & 0xff) << 24) |
           (static_cast<uint32_t>(mantissa) & 0x00ffffff);
}

uint16_t JoinSFloat(int32_t mantissa, int32_t exponent) {
    return static_cast<uint16_t>(((exponent & 0x0f) << 12) | (mantissa & 0x0fff));
}

Result<int> DecodeHeartRate(const std::vector<uint8_t>& payload) {
    if (payload.empty()) {
        return TooShort<int>("heart rate", 0, 2);
    }

    const bool is_u16 = payload[0] & 0x01;
    if (is_u16) {
        if (payload.size() < 3) {
            return TooShort<int>("heart rate", payload.size(), 3);
        }
        return Result<int>::Ok(ReadU16(payload, 1));
    }

    if (payload.size() < 2) {
        return TooShort<int>("heart rate", payload.size(), 2);
    }
    return Result<int>::Ok(payload[1]);
}

Result<double> DecodeTemperatureF(const std::vector<uint8_t>& payload) {
    if (payload.size() < 5) {
        return TooShort<double>("temperature", payload.size(), 5);
    }

    const bool fahrenheit = payload[0] & 0x01;
    const Ieee11073Number number = SplitFloat(ReadU32(payload, 1));
    if (number.IsSpecial(false)) {
        return Result<double>::Fail(VitalsError::DecodeError,
                                    "temperature: reserved FLOAT value, mantissa " +
                                        std::to_string(number.mantissa));
    }

    const double value = number.ToDouble();
    if (fahrenheit) {
        return Result<double>::Ok(RoundToTenth(value));
    }
    return Result<double>::Ok(RoundToTenth(value * 9.0 / 5.0 + 32.0));
}

Result<BloodPressureReading> DecodeBloodPressure(const std::vector<uint8_t>& payload) {
    if (payload.size() < 5) {
        return TooShort<BloodPressureReading>("blood pressure", payload.size(), 5);
    }

    const bool kpa = payload[0] & 0x01;
    const Ieee11073Number systolic = SplitSFloat(ReadU16(payload, 1));
    const Ieee11073Number diastolic = SplitSFloat(ReadU16(payload, 3));
    if (systolic.IsSpecial(true) || diastolic.IsSpecial(true)) {
        return Result<BloodPressureReading>::Fail(VitalsError::DecodeError,
                                                  "blood pressure: reserved SFLOAT value");
    }

    double scale = kpa ? kKpaToMmHg : 1.0;
    BloodPressureReading reading;
    if (!ToMmHg(systolic.ToDouble() * scale, reading.systolic) ||
        !ToMmHg(diastolic.ToDouble() * scale, reading.diastolic)) {
        return Result<BloodPressureReading>::Fail(VitalsError::DecodeError,
                                                  "blood pressure: value out of range");
    }
    return Result<BloodPressureReading>::Ok(reading);
}

Result<int> DecodeOxygenSaturation(const std::vector<uint8_t>& payload) {
    if (payload.size() < 2) {
        return TooShort<int>("oxygen saturation", payload.size(), 2);
    }
    return Result<int>::Ok(payload[1]);
}

Result<int> DecodeBatteryLevel(const std::vector<uint8_t>& payload) {
    if (payload.empty()) {
        return TooShort<int>("battery level", 0, 1);
    }
    if (payload[0] > 100) {
        return Result<int>::Fail(VitalsError::DecodeError,
                                 "battery level: " + std::to_string(payload[0]) + "% out of range");
    }
    return Result<int>::Ok(payload[0]);
}
