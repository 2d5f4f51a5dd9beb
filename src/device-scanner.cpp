#include "device-scanner.hpp"

#include <util/base.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

static std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

const std::vector<std::string>& DeviceScanner::DefaultKeywords() {
    static const std::vector<std::string> keywords = {
        "health", "heart", "fitbit", "garmin", "polar", "watch", "band", "mi", "huawei",
    };
    return keywords;
}

DeviceScanner::DeviceScanner(std::shared_ptr<BleAdapter> adapter)
    : DeviceScanner(std::move(adapter), DefaultKeywords()) {}

DeviceScanner::DeviceScanner(std::shared_ptr<BleAdapter> adapter, std::vector<std::string> keywords)
    : adapter_(std::move(adapter)) {
    for (auto& keyword : keywords) {
        if (!keyword.empty()) {
            keywords_.push_back(ToLower(std::move(keyword)));
        }
    }
}

bool DeviceScanner::Matches(const DeviceAdvertisement& advertisement) const {
    if (!advertisement.name || advertisement.name->empty()) return false;

    std::string name = ToLower(*advertisement.name);
    for (const auto& keyword : keywords_) {
        if (name.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<DeviceAdvertisement> DeviceScanner::Scan(std::chrono::milliseconds timeout) {
    // Shared with the adapter callback, which may still be in flight after
    // StopScan returns.
    struct ScanState {
        std::mutex mutex;
        std::map<std::string, DeviceAdvertisement> seen;
    };
    auto state = std::make_shared<ScanState>();

    blog(LOG_INFO, "Scanning for BLE health devices for %lld ms", (long long)timeout.count());
    auto deadline = std::chrono::steady_clock::now() + timeout;

    BleStatus status = adapter_->StartScan([state](const DeviceAdvertisement& adv) {
        std::lock_guard<std::mutex> lock(state->mutex);
        auto it = state->seen.find(adv.address);
        if (it == state->seen.end()) {
            state->seen.emplace(adv.address, adv);
            return;
        }
        // Keep the longest name seen, it is usually the complete local name.
        DeviceAdvertisement& known = it->second;
        if (adv.name && (!known.name || adv.name->length() > known.name->length())) {
            known.name = adv.name;
        }
        known.rssi = adv.rssi;
    });
    if (status != BleStatus::Success) {
        blog(LOG_WARNING, "Could not start scan: %s", BleStatusName(status));
        return {};
    }

    // One scan cycle: the radio stays on until the deadline.
    std::this_thread::sleep_until(deadline);
    adapter_->StopScan();

    std::vector<DeviceAdvertisement> devices;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        total = state->seen.size();
        for (const auto& entry : state->seen) {
            if (Matches(entry.second)) {
                devices.push_back(entry.second);
            }
        }
    }
    std::sort(devices.begin(), devices.end(),
              [](const DeviceAdvertisement& a, const DeviceAdvertisement& b) { return a.rssi > b.rssi; });

    if (devices.empty()) {
        blog(LOG_INFO, "Scan timed out with no health devices (%zu advertiser(s) seen)", total);
    } else {
        blog(LOG_INFO, "Scan found %zu health device(s) out of %zu advertiser(s)", devices.size(), total);
    }
    return devices;
}
