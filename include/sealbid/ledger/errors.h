// SEALBID - Ledger Error Model
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Rejection reasons returned by the bid ledger. Every mutating operation
// returns a LedgerResult; nothing is thrown across the ledger API.

#ifndef SEALBID_LEDGER_ERRORS_H
#define SEALBID_LEDGER_ERRORS_H

#include <cstdint>
#include <string>

namespace sealbid {
namespace ledger {

// ============================================================================
// Bid Errors
// ============================================================================

/// Ledger rejection reasons with their stable numeric codes
enum class BidError : uint16_t {
    OK = 0,
    
    /// Caller lacks the admin privilege
    UNAUTHORIZED = 200,
    
    /// Project is not registered
    PROJECT_NOT_FOUND = 201,
    
    /// Caller already holds a bid on the project
    ALREADY_SUBMITTED = 202,
    
    /// Commitment is not 32 bytes
    INVALID_HASH = 205,
    
    /// Ledger is paused
    PAUSED = 206,
    
    /// No bid for (project, caller)
    BID_NOT_FOUND = 208,
    
    /// Bid was already revealed
    ALREADY_REVEALED = 209,
    
    /// Reveal does not match the commitment, or description too long
    INVALID_REVEAL = 210,
    
    /// Bid is open (revealed) and can no longer be withdrawn
    ALREADY_OPENED = 211,
    
    /// Project holds the maximum number of bids
    BIDS_FULL = 212,
    
    /// Key-value backend failed to read or write
    STORAGE_FAILURE = 299,
};

/// Get string representation of a bid error ("Unauthorized", ...)
const char* BidErrorToString(BidError err);

/// Numeric code of a bid error
inline uint32_t BidErrorCode(BidError err) {
    return static_cast<uint32_t>(err);
}

// ============================================================================
// Ledger Result
// ============================================================================

/**
 * Outcome of a mutating ledger operation: success, or the first
 * precondition that failed.
 */
class LedgerResult {
public:
    LedgerResult() = default;
    
    static LedgerResult Ok() { return LedgerResult(); }
    
    static LedgerResult Error(BidError err) {
        LedgerResult r;
        r.error_ = err;
        return r;
    }
    
    bool IsOk() const { return error_ == BidError::OK; }
    explicit operator bool() const { return IsOk(); }
    
    BidError GetError() const { return error_; }
    uint32_t GetCode() const { return BidErrorCode(error_); }
    
    /// "ok" or "<Name> (<code>)"
    std::string ToString() const;
    
    bool operator==(const LedgerResult& other) const { return error_ == other.error_; }
    bool operator!=(const LedgerResult& other) const { return error_ != other.error_; }
    
private:
    BidError error_{BidError::OK};
};

} // namespace ledger
} // namespace sealbid

#endif // SEALBID_LEDGER_ERRORS_H
