#include "monitor-session.hpp"
#include "gatt-catalog.hpp"

#include <util/base.h>

#include <chrono>
#include <set>
#include <utility>

static bool IsLive(SessionState state) {
    return state == SessionState::Connecting || state == SessionState::Discovering ||
           state == SessionState::Monitoring;
}

static Status Cancelled(const std::string& address) {
    return Status::Fail(VitalsError::DisconnectedError,
                        "connect to " + address + " cancelled by disconnect");
}

// Trailing 0x00/0xFF padding is common in device name characteristics.
static std::string NameFromBytes(std::vector<uint8_t> bytes) {
    while (!bytes.empty() && (bytes.back() == 0x00 || bytes.back() == 0xff)) {
        bytes.pop_back();
    }
    return std::string(bytes.begin(), bytes.end());
}

MonitorSession::MonitorSession(std::shared_ptr<BleAdapter> adapter, std::shared_ptr<VitalsStore> store)
    : adapter_(std::move(adapter)),
      dispatcher_(std::make_shared<NotificationDispatcher>(adapter_, std::move(store))) {}

MonitorSession::~MonitorSession() {
    Disconnect();
}

bool MonitorSession::Transition(SessionState from, SessionState to) {
    std::string address;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != from) return false;
        state_ = to;
        address = address_;
    }
    blog(LOG_INFO, "Session %s: %s -> %s", address.c_str(), SessionStateName(from),
         SessionStateName(to));
    return true;
}

Status MonitorSession::Connect(const std::string& address) {
    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (IsLive(state_)) {
            return Status::Fail(VitalsError::InvalidState,
                                "session already " + std::string(SessionStateName(state_)) +
                                    " with " + address_);
        }
        if (state_ == SessionState::Failed) {
            return Status::Fail(VitalsError::InvalidState, "session failed, create a new one");
        }
        state_ = SessionState::Connecting;
        address_ = address;
        name_.clear();
        supported_.clear();
        offered_.clear();
        outcomes_.clear();
    }
    blog(LOG_INFO, "Session %s: %s -> %s", address.c_str(), SessionStateName(previous),
         SessionStateName(SessionState::Connecting));

    std::weak_ptr<MonitorSession> weak = weak_from_this();
    adapter_->SetLinkLostCallback([weak]() {
        if (auto self = weak.lock()) {
            self->OnLinkLost();
        }
    });

    BleStatus status = adapter_->Connect(address);
    if (status != BleStatus::Success) {
        if (!Transition(SessionState::Connecting, SessionState::Failed)) {
            return Cancelled(address);
        }
        adapter_->Disconnect();
        blog(LOG_WARNING, "Connection to %s failed: %s", address.c_str(), BleStatusName(status));
        return Status::Fail(VitalsError::ConnectionError,
                            "connect to " + address + " failed: " + BleStatusName(status));
    }

    if (!Transition(SessionState::Connecting, SessionState::Discovering)) {
        adapter_->Disconnect();
        return Cancelled(address);
    }

    std::vector<uint8_t> raw_name;
    std::string name;
    if (adapter_->ReadCharacteristic(kGenericAccessService, kDeviceNameCharacteristic, raw_name) ==
        BleStatus::Success) {
        name = NameFromBytes(std::move(raw_name));
    }
    if (name.empty()) {
        name = "Unknown";
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        name_ = name;
    }

    std::vector<ServiceOutcome> outcomes = NegotiateServices();

    if (!adapter_->IsConnected()) {
        if (Transition(SessionState::Discovering, SessionState::Failed)) {
            dispatcher_->ReleaseAll();
            adapter_->Disconnect();
            return Status::Fail(VitalsError::ConnectionError,
                                "link to " + address + " lost during discovery");
        }
    }

    size_t supported_count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Discovering) {
            for (const auto& outcome : outcomes) {
                if (outcome.status) {
                    supported_.insert(outcome.kind);
                }
            }
            supported_count = supported_.size();
            outcomes_ = outcomes;
        }
    }

    if (!Transition(SessionState::Discovering, SessionState::Monitoring)) {
        // Disconnect() ran during discovery; drop what was subscribed since.
        dispatcher_->UnsubscribeAll();
        return Cancelled(address);
    }

    blog(LOG_INFO, "Monitoring %s (%s) with %zu of %zu known service(s)", name.c_str(),
         address.c_str(), supported_count, outcomes.size());
    return Status::Ok();
}

std::vector<ServiceOutcome> MonitorSession::NegotiateServices() {
    std::vector<uint16_t> offered = adapter_->DiscoverServices();
    blog(LOG_INFO, "Peripheral offers %zu service(s)", offered.size());

    std::set<ServiceKind> offered_kinds;
    for (uint16_t uuid : offered) {
        if (auto kind = ServiceKindForUuid(uuid)) {
            offered_kinds.insert(*kind);
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        offered_ = offered_kinds;
    }

    std::vector<ServiceOutcome> outcomes;
    for (const auto& entry : KnownServices()) {
        if (offered_kinds.count(entry.kind) == 0) continue;

        Status status = dispatcher_->Subscribe(entry.kind);
        if (entry.readable) {
            // Readable values get an initial reading; a read-only
            // characteristic still counts as supported.
            Status read = ReadAndDispatch(entry.kind);
            if (!status && read) {
                status = Status::Ok();
            }
        }

        if (!status) {
            blog(LOG_WARNING, "Service %s unavailable: %s", ServiceKindName(entry.kind),
                 status.message().c_str());
        }
        outcomes.push_back(ServiceOutcome{ entry.kind, status });
    }
    return outcomes;
}

Status MonitorSession::ReadAndDispatch(ServiceKind kind) {
    const GattServiceEntry& entry = ServiceEntry(kind);

    std::vector<uint8_t> value;
    BleStatus status = adapter_->ReadCharacteristic(entry.service_uuid, entry.characteristic_uuid, value);
    if (status != BleStatus::Success) {
        return Status::Fail(VitalsError::ServiceUnavailable,
                            std::string("read of ") + FormatSigUuid(entry.characteristic_uuid) +
                                " failed: " + BleStatusName(status));
    }
    return dispatcher_->Dispatch(RawNotification{ kind, std::move(value), std::chrono::system_clock::now() });
}

Status MonitorSession::Refresh(ServiceKind kind) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!IsLive(state_)) {
            return Status::Fail(VitalsError::DisconnectedError,
                                std::string("session is ") + SessionStateName(state_));
        }
        // Before discovery completes, only services the peripheral offers
        // can be read.
        const std::set<ServiceKind>& known =
            state_ == SessionState::Monitoring ? supported_ : offered_;
        if (known.count(kind) == 0) {
            return Status::Fail(VitalsError::ServiceUnavailable,
                                std::string(ServiceKindName(kind)) + " is not supported by the peripheral");
        }
    }
    if (!ServiceEntry(kind).readable) {
        return Status::Fail(VitalsError::ServiceUnavailable,
                            std::string(ServiceKindName(kind)) + " can only be notified");
    }
    return ReadAndDispatch(kind);
}

void MonitorSession::Disconnect() {
    SessionState previous;
    std::string address;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (!IsLive(state_)) return;
        state_ = SessionState::Disconnected;
        address = address_;
    }
    blog(LOG_INFO, "Session %s: %s -> %s", address.c_str(), SessionStateName(previous),
         SessionStateName(SessionState::Disconnected));

    dispatcher_->UnsubscribeAll();
    adapter_->Disconnect();
}

void MonitorSession::OnLinkLost() {
    std::string address;
    SessionLinkLostCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Monitoring) return;
        state_ = SessionState::Disconnected;
        address = address_;
        callback = link_lost_callback_;
    }
    blog(LOG_WARNING, "Link to %s lost while monitoring", address.c_str());

    dispatcher_->ReleaseAll();
    adapter_->Disconnect();

    if (callback) {
        callback(address);
    }
}

SessionState MonitorSession::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

SessionInfo MonitorSession::Info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SessionInfo info;
    info.address = address_;
    info.name = name_;
    info.state = state_;
    info.supported_services = supported_;
    return info;
}

std::vector<ServiceOutcome> MonitorSession::ServiceOutcomes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcomes_;
}

void MonitorSession::SetLinkLostCallback(SessionLinkLostCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    link_lost_callback_ = std::move(callback);
}
