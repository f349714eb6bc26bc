// MINTGATE - Audit Events
// Copyright (c) 2024 MINTGATE Developers
// MIT License
//
// Append-only record of every successful state change. Events are for
// observers only; nothing in the collection reads them back.

#ifndef MINTGATE_COLLECTION_EVENTS_H
#define MINTGATE_COLLECTION_EVENTS_H

#include <mintgate/core/types.h>

#include <functional>
#include <string>
#include <vector>

namespace mintgate {
namespace collection {

enum class EventKind {
    Minted,
    ParameterChanged,
    RoleGranted,
    RoleRevoked,
    WithdrawalSubmitted,
    WithdrawalConfirmed,
    ConfirmationRevoked,
    WithdrawalExecuted,
    MintRelayed,
};

const char* EventKindToString(EventKind kind);

struct Event {
    EventKind kind{EventKind::Minted};

    /// Strictly increasing per log, starting at 1
    uint64_t sequence{0};

    /// Caller that triggered the change
    Address actor;

    /// Recipient, withdrawal target or role holder
    Address subject;

    /// Parameter or role name
    std::string parameter;
    std::string value;

    /// Withdrawal index
    uint64_t index{0};

    Amount amount{0};

    /// Tokens minted
    uint64_t count{0};

    /// One-line human readable form
    std::string ToString() const;
};

class EventLog {
public:
    using Listener = std::function<void(const Event&)>;

    /// Assign the next sequence number, store, and notify listeners.
    /// Returns the assigned sequence. A listener that throws a std::exception
    /// is logged and skipped; the event stays appended.
    uint64_t Append(Event event);

    void AddListener(Listener listener);

    const std::vector<Event>& GetEvents() const { return events_; }
    size_t Size() const { return events_.size(); }

    /// Sequence of the latest event, 0 when empty
    uint64_t LastSequence() const { return nextSequence_ - 1; }

private:
    std::vector<Event> events_;
    std::vector<Listener> listeners_;
    uint64_t nextSequence_{1};
};

} // namespace collection
} // namespace mintgate

#endif // MINTGATE_COLLECTION_EVENTS_H
