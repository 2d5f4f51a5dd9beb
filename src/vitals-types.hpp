#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

enum class ServiceKind {
    HeartRate,
    HealthThermometer,
    BloodPressure,
    PulseOximeter,
    Battery,
};

constexpr size_t kServiceKindCount = 5;

enum class SessionState {
    Idle,
    Connecting,
    Discovering,
    Monitoring,
    Disconnected,
    Failed,
};

enum class VitalsError {
    None,
    ScanTimeout,
    ConnectionError,
    ServiceUnavailable,
    DecodeError,
    LinkLost,
    DisconnectedError,
    InvalidState,
};

const char* ServiceKindName(ServiceKind kind);
const char* SessionStateName(SessionState state);
const char* VitalsErrorName(VitalsError error);

struct DeviceAdvertisement {
    std::string address;
    std::optional<std::string> name;
    int rssi = 0;
};

struct VitalsSnapshot {
    std::optional<int> heart_rate_bpm;
    std::optional<double> temperature_f;
    std::optional<int> blood_pressure_systolic;
    std::optional<int> blood_pressure_diastolic;
    std::optional<int> oxygen_saturation_pct;
    std::optional<int> battery_pct;
};

struct RawNotification {
    ServiceKind kind;
    std::vector<uint8_t> payload;
    std::chrono::system_clock::time_point received_at;
};

struct SessionInfo {
    std::string address;
    std::string name;
    SessionState state = SessionState::Idle;
    std::set<ServiceKind> supported_services;
};

// Outcome of an operation with no value.
class Status {
public:
    Status() = default;

    static Status Ok() { return Status(); }
    static Status Fail(VitalsError error, std::string message) {
        Status status;
        status.error_ = error;
        status.message_ = std::move(message);
        return status;
    }

    bool ok() const { return error_ == VitalsError::None; }
    explicit operator bool() const { return ok(); }
    VitalsError error() const { return error_; }
    const std::string& message() const { return message_; }

private:
    VitalsError error_ = VitalsError::None;
    std::string message_;
};

// Value on success, error and message otherwise.
template <typename T>
class Result {
public:
    static Result Ok(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }
    static Result Fail(VitalsError error, std::string message) {
        Result result;
        result.status_ = Status::Fail(error, std::move(message));
        return result;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }
    const T& value() const { return *value_; }
    VitalsError error() const { return status_.error(); }
    const std::string& message() const { return status_.message(); }
    const Status& status() const { return status_; }

private:
    Result() = default;

    std::optional<T> value_;
    Status status_;
};
