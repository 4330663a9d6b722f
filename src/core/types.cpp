// SEALBID - Core Types Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/core/types.h"
#include "sealbid/core/hex.h"

namespace sealbid {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::vector<Byte> bytes = HexToBytes(hex);
    if (bytes.size() != SIZE) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;

} // namespace sealbid
