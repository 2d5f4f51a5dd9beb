#include "ble-adapter.hpp"

const char* BleStatusName(BleStatus status) {
    switch (status) {
    case BleStatus::Success: return "success";
    case BleStatus::Timeout: return "timeout";
    case BleStatus::Refused: return "refused";
    case BleStatus::Unreachable: return "unreachable";
    case BleStatus::NotSupported: return "not supported";
    case BleStatus::Failed: return "failed";
    }
    return "unknown";
}
