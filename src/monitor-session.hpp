#pragma once
#include "ble-adapter.hpp"
#include "notification-dispatcher.hpp"
#include "vitals-store.hpp"
#include "vitals-types.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using SessionLinkLostCallback = std::function<void(const std::string& address)>;

struct ServiceOutcome {
    ServiceKind kind;
    Status status;
};

/*
 * One peripheral connection:
 *
 *   Idle/Disconnected -> Connecting -> Discovering -> Monitoring -> Disconnected
 *
 * Connecting fails into the terminal Failed state. Link loss while Monitoring
 * ends in Disconnected and is reported through the link lost callback. Nothing
 * is retried. Must be owned by a shared_ptr.
 */
class MonitorSession : public std::enable_shared_from_this<MonitorSession> {
public:
    MonitorSession(std::shared_ptr<BleAdapter> adapter, std::shared_ptr<VitalsStore> store);
    ~MonitorSession();

    Status Connect(const std::string& address);
    void Disconnect();

    // Reads a readable characteristic (battery) now and routes the value
    // through the dispatcher.
    Status Refresh(ServiceKind kind);

    SessionState State() const;
    SessionInfo Info() const;
    // Per-service results of the last discovery, known services only.
    std::vector<ServiceOutcome> ServiceOutcomes() const;

    void SetLinkLostCallback(SessionLinkLostCallback callback);

private:
    bool Transition(SessionState from, SessionState to);
    std::vector<ServiceOutcome> NegotiateServices();
    Status ReadAndDispatch(ServiceKind kind);
    void OnLinkLost();

    std::shared_ptr<BleAdapter> adapter_;
    std::shared_ptr<NotificationDispatcher> dispatcher_;

    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Idle;
    std::string address_;
    std::string name_;
    std::set<ServiceKind> supported_;
    std::set<ServiceKind> offered_; // known once services are discovered
    std::vector<ServiceOutcome> outcomes_;
    SessionLinkLostCallback link_lost_callback_;
};
