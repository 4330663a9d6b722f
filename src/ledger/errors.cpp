// SEALBID - Ledger Error Model Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/ledger/errors.h"

namespace sealbid {
namespace ledger {

const char* BidErrorToString(BidError err) {
    switch (err) {
        case BidError::OK: return "OK";
        case BidError::UNAUTHORIZED: return "Unauthorized";
        case BidError::PROJECT_NOT_FOUND: return "ProjectNotFound";
        case BidError::ALREADY_SUBMITTED: return "AlreadySubmitted";
        case BidError::INVALID_HASH: return "InvalidHash";
        case BidError::PAUSED: return "Paused";
        case BidError::BID_NOT_FOUND: return "BidNotFound";
        case BidError::ALREADY_REVEALED: return "AlreadyRevealed";
        case BidError::INVALID_REVEAL: return "InvalidReveal";
        case BidError::ALREADY_OPENED: return "AlreadyOpened";
        case BidError::BIDS_FULL: return "BidsFull";
        case BidError::STORAGE_FAILURE: return "StorageFailure";
    }
    return "Unknown";
}

std::string LedgerResult::ToString() const {
    if (IsOk()) {
        return "ok";
    }
    return std::string(BidErrorToString(error_)) + " (" + std::to_string(GetCode()) + ")";
}

} // namespace ledger
} // namespace sealbid
