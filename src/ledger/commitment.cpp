// SEALBID - Bid Commitment Scheme Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/ledger/commitment.h"
#include "sealbid/core/serialize.h"
#include "sealbid/crypto/sha256.h"

namespace sealbid {
namespace ledger {

std::vector<Byte> EncodePrincipal(const Principal& principal) {
    return std::vector<Byte>(principal.begin(), principal.end());
}

std::vector<Byte> EncodeBidPreimage(BidAmount amount,
                                    const std::string& description,
                                    const Principal& bidder) {
    DataStream ss;
    WriteBE<uint64_t>(ss, amount);
    ss.Write(description.data(), description.size());
    
    std::vector<Byte> principal = EncodePrincipal(bidder);
    ss.Write(principal.data(), principal.size());
    
    return ss.Data();
}

Hash256 ComputeBidCommitment(BidAmount amount,
                             const std::string& description,
                             const Principal& bidder) {
    return SHA256Hash(EncodeBidPreimage(amount, description, bidder));
}

bool VerifyBidCommitment(const Hash256& stored,
                         BidAmount amount,
                         const std::string& description,
                         const Principal& bidder) {
    return ComputeBidCommitment(amount, description, bidder) == stored;
}

std::optional<size_t> Utf8Length(const std::string& text) {
    size_t count = 0;
    size_t i = 0;
    const size_t n = text.size();
    
    while (i < n) {
        uint8_t c = static_cast<uint8_t>(text[i]);
        size_t extra;
        uint32_t cp;
        
        if (c < 0x80) {
            extra = 0;
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            cp = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            cp = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            cp = c & 0x07;
        } else {
            return std::nullopt;
        }
        
        // Truncated sequence
        if (extra > n - i - 1) {
            return std::nullopt;
        }
        
        for (size_t k = 1; k <= extra; ++k) {
            uint8_t cc = static_cast<uint8_t>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return std::nullopt;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        
        // Overlong encodings
        if ((extra == 1 && cp < 0x80) ||
            (extra == 2 && cp < 0x800) ||
            (extra == 3 && cp < 0x10000)) {
            return std::nullopt;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return std::nullopt;
        }
        
        i += extra + 1;
        ++count;
    }
    
    return count;
}

} // namespace ledger
} // namespace sealbid
