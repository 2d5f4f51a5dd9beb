#pragma once
#include "ble-adapter.hpp"
#include "vitals-types.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

// One bounded advertisement scan, filtered to names that look like health
// wearables.
class DeviceScanner {
public:
    explicit DeviceScanner(std::shared_ptr<BleAdapter> adapter);
    DeviceScanner(std::shared_ptr<BleAdapter> adapter, std::vector<std::string> keywords);

    // Blocks for the whole timeout. Never fails: no match, or a radio that
    // refuses to scan, yields an empty list.
    std::vector<DeviceAdvertisement> Scan(std::chrono::milliseconds timeout);

    bool Matches(const DeviceAdvertisement& advertisement) const;

    static const std::vector<std::string>& DefaultKeywords();

private:
    std::shared_ptr<BleAdapter> adapter_;
    std::vector<std::string> keywords_; // lower case
};
