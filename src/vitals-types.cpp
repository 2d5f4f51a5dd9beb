#include "vitals-types.hpp"

const char* ServiceKindName(ServiceKind kind) {
    switch (kind) {
    case ServiceKind::HeartRate: return "heart_rate";
    case ServiceKind::HealthThermometer: return "health_thermometer";
    case ServiceKind::BloodPressure: return "blood_pressure";
    case ServiceKind::PulseOximeter: return "pulse_oximeter";
    case ServiceKind::Battery: return "battery";
    }
    return "unknown";
}

const char* SessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Idle: return "idle";
    case SessionState::Connecting: return "connecting";
    case SessionState::Discovering: return "discovering";
    case SessionState::Monitoring: return "monitoring";
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* VitalsErrorName(VitalsError error) {
    switch (error) {
    case VitalsError::None: return "none";
    case VitalsError::ScanTimeout: return "scan_timeout";
    case VitalsError::ConnectionError: return "connection_error";
    case VitalsError::ServiceUnavailable: return "service_unavailable";
    case VitalsError::DecodeError: return "decode_error";
    case VitalsError::LinkLost: return "link_lost";
    case VitalsError::DisconnectedError: return "disconnected";
    case VitalsError::InvalidState: return "invalid_state";
    }
    return "unknown";
}
