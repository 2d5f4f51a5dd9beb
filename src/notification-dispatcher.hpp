#pragma once
#include "ble-adapter.hpp"
#include "vitals-store.hpp"
#include "vitals-types.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>

// Routes characteristic values to their decoder and the decoded value to the
// store. Holds at most one adapter subscription per ServiceKind. Must be owned
// by a shared_ptr so adapter callbacks can outlive it safely.
class NotificationDispatcher : public std::enable_shared_from_this<NotificationDispatcher> {
public:
    NotificationDispatcher(std::shared_ptr<BleAdapter> adapter, std::shared_ptr<VitalsStore> store);

    // Replaces any existing subscription for the kind.
    Status Subscribe(ServiceKind kind);

    // Decodes one value and pushes it to the store. A decode failure leaves
    // the store unchanged and is returned as DecodeError.
    Status Dispatch(const RawNotification& notification);

    // Releases every subscription with the adapter. Safe to call repeatedly.
    // Waits for values already being dispatched, so nothing reaches the store
    // once it returns. Must not be called from a store observer.
    void UnsubscribeAll();
    // Forgets every subscription without talking to the adapter. Waits for
    // in-flight values like UnsubscribeAll.
    void ReleaseAll();

    bool IsSubscribed(ServiceKind kind) const;

private:
    void Deliver(const RawNotification& notification, uint64_t generation);
    Status DispatchLocked(const RawNotification& notification);
    bool ClearGeneration(ServiceKind kind);

    std::shared_ptr<BleAdapter> adapter_;
    std::shared_ptr<VitalsStore> store_;

    mutable std::mutex mutex_;
    std::array<uint64_t, kServiceKindCount> active_{}; // 0 = not subscribed
    uint64_t next_generation_ = 1;

    // Serializes processing of one kind so values land in arrival order.
    // Always taken before mutex_.
    std::array<std::mutex, kServiceKindCount> kind_mutex_;
};
