#pragma once
#include "ble-adapter.hpp"
#include "device-scanner.hpp"
#include "monitor-session.hpp"
#include "vitals-store.hpp"
#include "vitals-types.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Entry point of the core: scans, owns at most one live session and the
// vitals store fed by it. Scan and Connect never run concurrently; Disconnect
// may be called at any time and cancels a connect in progress.
class VitalsMonitor {
public:
    explicit VitalsMonitor(std::shared_ptr<BleAdapter> adapter);
    VitalsMonitor(std::shared_ptr<BleAdapter> adapter, std::vector<std::string> scan_keywords);
    ~VitalsMonitor();

    VitalsMonitor(const VitalsMonitor&) = delete;
    VitalsMonitor& operator=(const VitalsMonitor&) = delete;

    std::vector<DeviceAdvertisement> Scan(std::chrono::milliseconds timeout);

    // Tears down any live session, clears the store and connects a fresh one.
    Status Connect(const std::string& address);
    void Disconnect();
    Status Refresh(ServiceKind kind);

    VitalsSnapshot GetSnapshot() const;
    VitalsStore::SubscriptionId Subscribe(VitalsCallback callback);
    void Unsubscribe(VitalsStore::SubscriptionId id);

    void SetLinkLostCallback(SessionLinkLostCallback callback);

    SessionState State() const;
    std::optional<SessionInfo> CurrentSession() const;

private:
    std::shared_ptr<MonitorSession> Session() const;

    std::shared_ptr<BleAdapter> adapter_;
    std::shared_ptr<VitalsStore> store_;
    DeviceScanner scanner_;

    std::mutex operation_mutex_;

    mutable std::mutex session_mutex_;
    std::shared_ptr<MonitorSession> session_;
    SessionLinkLostCallback link_lost_callback_;
};
