// MINTGUARD - Issuance Notifications
// Copyright (c) 2024 MINTGUARD Developers
// MIT License
//
// Notifications are append-only log entries. They are emitted only after an
// operation has fully succeeded and are never consulted as state.

#ifndef MINTGUARD_ISSUANCE_EVENTS_H
#define MINTGUARD_ISSUANCE_EVENTS_H

#include "mintguard/core/types.h"

#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include <vector>

namespace mintguard {
namespace issuance {

// ============================================================================
// Event Types
// ============================================================================

/// An identity was granted issuer rights
struct IssuerAuthorizedEvent {
    Identity issuer;
    BlockHeight expirationBlock{0};
};

/// An identity lost issuer rights (voluntarily, by expiry, or by sweep)
struct IssuerDeauthorizedEvent {
    Identity issuer;
    Identity caller;
};

/// Issuer rights and history moved from one identity to another
struct IssuerAuthorizationTransferredEvent {
    Identity from;
    Identity to;
    uint32_t position{0};
};

/// An issuer minted or burned. Running totals are the values after the call.
struct IssuerActivityEvent {
    Identity issuer;
    Amount minted{0};
    Amount burned{0};
    Amount totalMinted{0};
    uint64_t mintCount{0};
    Amount totalBurned{0};
    uint64_t burnCount{0};
};

using IssuanceEvent = std::variant<
    IssuerAuthorizedEvent,
    IssuerDeauthorizedEvent,
    IssuerAuthorizationTransferredEvent,
    IssuerActivityEvent>;

/// Event name ("IssuerAuthorized", ...)
const char* EventName(const IssuanceEvent& event);

/// One-line description of an event for logs and executor output
std::string FormatEvent(const IssuanceEvent& event);

// ============================================================================
// Event Journal
// ============================================================================

/**
 * Append-only notification log.
 *
 * Each recorded event carries the block height of the operation that
 * produced it. Listeners are invoked synchronously on append.
 */
class EventJournal {
public:
    struct Entry {
        BlockHeight height{0};
        IssuanceEvent event;
    };

    using Listener = std::function<void(const Entry&)>;

    /// Append an event
    void Append(BlockHeight height, IssuanceEvent event);

    /// All events in emission order
    const std::vector<Entry>& Entries() const { return entries_; }

    /// Number of recorded events
    size_t Size() const { return entries_.size(); }

    bool Empty() const { return entries_.empty(); }

    /// Most recent event; the journal must not be empty
    const Entry& Back() const { return entries_.back(); }

    /// Events appended after the first `offset` entries
    std::vector<Entry> Since(size_t offset) const;

    /// Register a listener called for every appended event
    void SetListener(Listener listener) { listener_ = std::move(listener); }

private:
    std::vector<Entry> entries_;
    Listener listener_;
};

} // namespace issuance
} // namespace mintguard

#endif // MINTGUARD_ISSUANCE_EVENTS_H
