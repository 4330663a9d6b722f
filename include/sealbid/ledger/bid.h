// SEALBID - Bid Data Model
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Records held by the bid ledger: the per-project list of bid headers and
// the per-(project, bidder) bid record.

#ifndef SEALBID_LEDGER_BID_H
#define SEALBID_LEDGER_BID_H

#include "sealbid/core/types.h"
#include "sealbid/core/serialize.h"

#include <optional>
#include <string>
#include <vector>

namespace sealbid {
namespace ledger {

// ============================================================================
// Constants
// ============================================================================

/// Maximum number of live bids per project
constexpr size_t MAX_BIDS_PER_PROJECT = 50;

/// Maximum description length in characters (code points)
constexpr size_t MAX_DESCRIPTION_LENGTH = 500;

/// Size of a bid commitment in bytes
constexpr size_t COMMITMENT_SIZE = Hash256::SIZE;

static_assert(COMMITMENT_SIZE == 32, "commitment must be a 256-bit digest");

// ============================================================================
// Validation Helpers
// ============================================================================

/// True if a submitted commitment has the required length
bool IsValidCommitmentSize(const std::vector<Byte>& commitment);

/// True if text is valid UTF-8 of at most MAX_DESCRIPTION_LENGTH characters
bool IsValidDescription(const std::string& description);

// ============================================================================
// Bid Header
// ============================================================================

/// Entry in a project's bid list
struct BidHeader {
    Principal bidder;
    Hash256 commitment;
    BlockHeight submittedAt{0};
    
    bool operator==(const BidHeader& other) const {
        return bidder == other.bidder &&
               commitment == other.commitment &&
               submittedAt == other.submittedAt;
    }
    bool operator!=(const BidHeader& other) const { return !(*this == other); }
};

// ============================================================================
// Bid Record
// ============================================================================

/**
 * Full bid detail for one (project, bidder) pair.
 *
 * Sealed until revealed: amount is 0, description empty and revealedAt
 * absent. A reveal fills all three and sets revealed.
 */
struct BidRecord {
    Hash256 commitment;
    BidAmount amount{0};
    std::string description;
    bool revealed{false};
    std::optional<BlockHeight> revealedAt;
    
    /// New unrevealed record for a commitment
    static BidRecord Sealed(const Hash256& commitment) {
        BidRecord r;
        r.commitment = commitment;
        return r;
    }
    
    bool operator==(const BidRecord& other) const {
        return commitment == other.commitment &&
               amount == other.amount &&
               description == other.description &&
               revealed == other.revealed &&
               revealedAt == other.revealedAt;
    }
    bool operator!=(const BidRecord& other) const { return !(*this == other); }
};

// ============================================================================
// Project Bid List
// ============================================================================

/**
 * Insertion-ordered list of bid headers for one project, bounded to
 * MAX_BIDS_PER_PROJECT entries. Append refuses to grow past capacity;
 * callers check IsFull() first.
 */
class ProjectBidList {
public:
    static constexpr size_t CAPACITY = MAX_BIDS_PER_PROJECT;
    
    using const_iterator = std::vector<BidHeader>::const_iterator;
    
    ProjectBidList() = default;
    
    size_t Size() const { return bids_.size(); }
    bool IsEmpty() const { return bids_.empty(); }
    bool IsFull() const { return bids_.size() >= CAPACITY; }
    
    /// Append a header; returns false (and leaves the list unchanged) when full
    bool Append(BidHeader header);
    
    /// Header for a bidder, or nullptr
    const BidHeader* Find(const Principal& bidder) const;
    
    bool Contains(const Principal& bidder) const { return Find(bidder) != nullptr; }
    
    /// Remove a bidder's header keeping the order of the rest
    bool Remove(const Principal& bidder);
    
    const std::vector<BidHeader>& GetBids() const { return bids_; }
    
    const_iterator begin() const { return bids_.begin(); }
    const_iterator end() const { return bids_.end(); }
    
    bool operator==(const ProjectBidList& other) const { return bids_ == other.bids_; }
    bool operator!=(const ProjectBidList& other) const { return bids_ != other.bids_; }
    
    template<typename Stream>
    void Serialize(Stream& s) const {
        ::sealbid::Serialize(s, bids_);
    }
    
    template<typename Stream>
    void Unserialize(Stream& s) {
        std::vector<BidHeader> bids;
        ::sealbid::Unserialize(s, bids);
        if (bids.size() > CAPACITY) {
            throw std::ios_base::failure("ProjectBidList: too many entries");
        }
        bids_ = std::move(bids);
    }
    
private:
    std::vector<BidHeader> bids_;
};

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const BidHeader& h) {
    ::sealbid::Serialize(s, h.bidder);
    ::sealbid::Serialize(s, h.commitment);
    ::sealbid::Serialize(s, h.submittedAt);
}

template<typename Stream>
void Unserialize(Stream& s, BidHeader& h) {
    ::sealbid::Unserialize(s, h.bidder);
    ::sealbid::Unserialize(s, h.commitment);
    ::sealbid::Unserialize(s, h.submittedAt);
}

template<typename Stream>
void Serialize(Stream& s, const BidRecord& r) {
    ::sealbid::Serialize(s, r.commitment);
    ::sealbid::Serialize(s, r.amount);
    ::sealbid::Serialize(s, r.description);
    ::sealbid::Serialize(s, r.revealed);
    ::sealbid::Serialize(s, r.revealedAt);
}

template<typename Stream>
void Unserialize(Stream& s, BidRecord& r) {
    ::sealbid::Unserialize(s, r.commitment);
    ::sealbid::Unserialize(s, r.amount);
    ::sealbid::Unserialize(s, r.description);
    ::sealbid::Unserialize(s, r.revealed);
    ::sealbid::Unserialize(s, r.revealedAt);
}

template<typename Stream>
void Serialize(Stream& s, const ProjectBidList& list) {
    list.Serialize(s);
}

template<typename Stream>
void Unserialize(Stream& s, ProjectBidList& list) {
    list.Unserialize(s);
}

} // namespace ledger
} // namespace sealbid

#endif // SEALBID_LEDGER_BID_H
