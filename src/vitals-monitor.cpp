#include "vitals-monitor.hpp"

#include <util/base.h>

#include <utility>

VitalsMonitor::VitalsMonitor(std::shared_ptr<BleAdapter> adapter)
    : adapter_(adapter), store_(std::make_shared<VitalsStore>()), scanner_(adapter) {}

VitalsMonitor::VitalsMonitor(std::shared_ptr<BleAdapter> adapter, std::vector<std::string> scan_keywords)
    : adapter_(adapter),
      store_(std::make_shared<VitalsStore>()),
      scanner_(adapter, std::move(scan_keywords)) {}

VitalsMonitor::~VitalsMonitor() {
    Disconnect();
}

std::shared_ptr<MonitorSession> VitalsMonitor::Session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

std::vector<DeviceAdvertisement> VitalsMonitor::Scan(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(operation_mutex_);
    return scanner_.Scan(timeout);
}

Status VitalsMonitor::Connect(const std::string& address) {
    std::lock_guard<std::mutex> lock(operation_mutex_);

    auto session = std::make_shared<MonitorSession>(adapter_, store_);
    std::shared_ptr<MonitorSession> previous;
    {
        std::lock_guard<std::mutex> session_lock(session_mutex_);
        previous = std::move(session_);
        session_ = session;
        session->SetLinkLostCallback(link_lost_callback_);
    }

    if (previous) {
        SessionInfo info = previous->Info();
        if (info.state != SessionState::Idle && info.state != SessionState::Disconnected &&
            info.state != SessionState::Failed) {
            blog(LOG_INFO, "Closing session with %s before connecting to %s", info.address.c_str(),
                 address.c_str());
        }
        previous->Disconnect();
    }

    store_->Reset();
    return session->Connect(address);
}

void VitalsMonitor::Disconnect() {
    if (auto session = Session()) {
        session->Disconnect();
    }
}

Status VitalsMonitor::Refresh(ServiceKind kind) {
    auto session = Session();
    if (!session) {
        return Status::Fail(VitalsError::DisconnectedError, "no session");
    }
    return session->Refresh(kind);
}

VitalsSnapshot VitalsMonitor::GetSnapshot() const {
    return store_->GetSnapshot();
}

VitalsStore::SubscriptionId VitalsMonitor::Subscribe(VitalsCallback callback) {
    return store_->Subscribe(std::move(callback));
}

void VitalsMonitor::Unsubscribe(VitalsStore::SubscriptionId id) {
    store_->Unsubscribe(id);
}

void VitalsMonitor::SetLinkLostCallback(SessionLinkLostCallback callback) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    link_lost_callback_ = callback;
    if (session_) {
        session_->SetLinkLostCallback(std::move(callback));
    }
}

SessionState VitalsMonitor::State() const {
    auto session = Session();
    return session ? session->State() : SessionState::Idle;
}

std::optional<SessionInfo> VitalsMonitor::CurrentSession() const {
    auto session = Session();
    if (!session) return std::nullopt;
    return session->Info();
}
