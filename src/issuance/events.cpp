// MINTGUARD - Issuance Notifications Implementation
// Copyright (c) 2024 MINTGUARD Developers
// MIT License

#include "mintguard/issuance/events.h"

#include <sstream>

namespace mintguard {
namespace issuance {

namespace {

struct NameVisitor {
    const char* operator()(const IssuerAuthorizedEvent&) const { return "IssuerAuthorized"; }
    const char* operator()(const IssuerDeauthorizedEvent&) const { return "IssuerDeauthorized"; }
    const char* operator()(const IssuerAuthorizationTransferredEvent&) const {
        return "IssuerAuthorizationTransferred";
    }
    const char* operator()(const IssuerActivityEvent&) const { return "IssuerActivity"; }
};

struct FormatVisitor {
    std::ostringstream& os;

    void operator()(const IssuerAuthorizedEvent& e) const {
        os << "issuer=" << e.issuer.ToHex() << " expiration=" << e.expirationBlock;
    }

    void operator()(const IssuerDeauthorizedEvent& e) const {
        os << "issuer=" << e.issuer.ToHex() << " caller=" << e.caller.ToHex();
    }

    void operator()(const IssuerAuthorizationTransferredEvent& e) const {
        os << "from=" << e.from.ToHex() << " to=" << e.to.ToHex()
           << " position=" << e.position;
    }

    void operator()(const IssuerActivityEvent& e) const {
        os << "issuer=" << e.issuer.ToHex()
           << " minted=" << FormatAmount(e.minted)
           << " burned=" << FormatAmount(e.burned)
           << " totalMinted=" << FormatAmount(e.totalMinted)
           << " mintCount=" << e.mintCount
           << " totalBurned=" << FormatAmount(e.totalBurned)
           << " burnCount=" << e.burnCount;
    }
};

} // namespace

const char* EventName(const IssuanceEvent& event) {
    return std::visit(NameVisitor{}, event);
}

std::string FormatEvent(const IssuanceEvent& event) {
    std::ostringstream os;
    os << EventName(event) << " ";
    std::visit(FormatVisitor{os}, event);
    return os.str();
}

// ============================================================================
// EventJournal
// ============================================================================

void EventJournal::Append(BlockHeight height, IssuanceEvent event) {
    entries_.push_back(Entry{height, std::move(event)});
    if (listener_) {
        listener_(entries_.back());
    }
}

std::vector<EventJournal::Entry> EventJournal::Since(size_t offset) const {
    if (offset >= entries_.size()) {
        return {};
    }
    return std::vector<Entry>(entries_.begin() + offset, entries_.end());
}

} // namespace issuance
} // namespace mintguard
