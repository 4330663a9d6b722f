// SEALBID - Bid Data Model Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/ledger/bid.h"
#include "sealbid/ledger/commitment.h"

#include <algorithm>

namespace sealbid {
namespace ledger {

bool IsValidCommitmentSize(const std::vector<Byte>& commitment) {
    return commitment.size() == COMMITMENT_SIZE;
}

bool IsValidDescription(const std::string& description) {
    // Each code point takes at least one byte
    if (description.size() <= MAX_DESCRIPTION_LENGTH) {
        return Utf8Length(description).has_value();
    }
    auto length = Utf8Length(description);
    return length && *length <= MAX_DESCRIPTION_LENGTH;
}

// ============================================================================
// ProjectBidList
// ============================================================================

bool ProjectBidList::Append(BidHeader header) {
    if (IsFull()) {
        return false;
    }
    bids_.push_back(std::move(header));
    return true;
}

const BidHeader* ProjectBidList::Find(const Principal& bidder) const {
    auto it = std::find_if(bids_.begin(), bids_.end(),
        [&bidder](const BidHeader& h) { return h.bidder == bidder; });
    return it == bids_.end() ? nullptr : &*it;
}

bool ProjectBidList::Remove(const Principal& bidder) {
    auto it = std::find_if(bids_.begin(), bids_.end(),
        [&bidder](const BidHeader& h) { return h.bidder == bidder; });
    if (it == bids_.end()) {
        return false;
    }
    bids_.erase(it);
    return true;
}

} // namespace ledger
} // namespace sealbid
