// MINTGATE - Audit Events Implementation
// Copyright (c) 2024 MINTGATE Developers
// MIT License

#include <mintgate/collection/events.h>
#include <mintgate/util/logging.h>

#include <exception>
#include <sstream>

namespace mintgate {
namespace collection {

const char* EventKindToString(EventKind kind) {
    switch (kind) {
        case EventKind::Minted: return "Minted";
        case EventKind::ParameterChanged: return "ParameterChanged";
        case EventKind::RoleGranted: return "RoleGranted";
        case EventKind::RoleRevoked: return "RoleRevoked";
        case EventKind::WithdrawalSubmitted: return "WithdrawalSubmitted";
        case EventKind::WithdrawalConfirmed: return "WithdrawalConfirmed";
        case EventKind::ConfirmationRevoked: return "ConfirmationRevoked";
        case EventKind::WithdrawalExecuted: return "WithdrawalExecuted";
        case EventKind::MintRelayed: return "MintRelayed";
        default: return "Unknown";
    }
}

std::string Event::ToString() const {
    std::ostringstream oss;
    oss << "#" << sequence << " " << EventKindToString(kind)
        << " actor=" << actor.ToString();

    switch (kind) {
        case EventKind::Minted:
        case EventKind::MintRelayed:
            oss << " to=" << subject.ToString() << " count=" << count
                << " paid=" << FormatAmount(amount);
            break;
        case EventKind::ParameterChanged:
            oss << " " << parameter << "=" << value;
            break;
        case EventKind::RoleGranted:
        case EventKind::RoleRevoked:
            oss << " role=" << parameter << " account=" << subject.ToString();
            break;
        case EventKind::WithdrawalSubmitted:
        case EventKind::WithdrawalExecuted:
            oss << " index=" << index << " to=" << subject.ToString()
                << " value=" << FormatAmount(amount);
            break;
        case EventKind::WithdrawalConfirmed:
        case EventKind::ConfirmationRevoked:
            oss << " index=" << index;
            break;
    }
    return oss.str();
}

uint64_t EventLog::Append(Event event) {
    event.sequence = nextSequence_++;
    events_.push_back(event);
    // The change is already committed; a failing listener cannot undo it
    for (const auto& listener : listeners_) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            LOG_WARN(util::LogCategory::DEFAULT) << "Event listener failed on "
                                                 << EventKindToString(event.kind) << " #"
                                                 << event.sequence << ": " << e.what();
        }
    }
    return event.sequence;
}

void EventLog::AddListener(Listener listener) {
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

} // namespace collection
} // namespace mintgate
