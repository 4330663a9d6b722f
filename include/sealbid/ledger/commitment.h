// SEALBID - Bid Commitment Scheme
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// A bid commitment is SHA-256 over the pre-image
//
//     amount (8 bytes, big-endian) || description (UTF-8) || bidder (UTF-8)
//
// with no length prefixes or padding. Every implementation must produce
// this exact byte layout for commitments to verify across tools.

#ifndef SEALBID_LEDGER_COMMITMENT_H
#define SEALBID_LEDGER_COMMITMENT_H

#include "sealbid/core/types.h"

#include <optional>
#include <string>
#include <vector>

namespace sealbid {
namespace ledger {

/// Canonical byte encoding of a caller identity (its UTF-8 bytes)
std::vector<Byte> EncodePrincipal(const Principal& principal);

/// Build the commitment pre-image for a bid
std::vector<Byte> EncodeBidPreimage(BidAmount amount,
                                    const std::string& description,
                                    const Principal& bidder);

/// Commitment a bidder submits for the given bid content
Hash256 ComputeBidCommitment(BidAmount amount,
                             const std::string& description,
                             const Principal& bidder);

/// True if the content hashes to the stored commitment
bool VerifyBidCommitment(const Hash256& stored,
                         BidAmount amount,
                         const std::string& description,
                         const Principal& bidder);

/**
 * Count Unicode code points in UTF-8 text.
 * @return Number of code points, or nullopt if the text is not valid UTF-8
 *         (overlong forms, surrogates and values above U+10FFFF are invalid)
 */
std::optional<size_t> Utf8Length(const std::string& text);

} // namespace ledger
} // namespace sealbid

#endif // SEALBID_LEDGER_COMMITMENT_H
