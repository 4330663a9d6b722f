// SEALBID - Core Types Header
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// This file defines fundamental types used throughout SEALBID.

#ifndef SEALBID_CORE_TYPES_H
#define SEALBID_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <cstring>

namespace sealbid {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Project identifier assigned by the project registry
using ProjectId = uint64_t;

/// Revealed bid value in the smallest currency unit
using BidAmount = uint64_t;

/// Logical clock supplied by the execution environment
using BlockHeight = uint64_t;

/// Authenticated caller identity.
/// The canonical byte encoding of a principal is its raw UTF-8 text.
using Principal = std::string;

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque digest
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (shorter input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, std::min(len, SIZE));
        }
    }
    
    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }
    
    /// Compare against an arbitrary byte sequence (length must match)
    bool Equals(const std::vector<Byte>& bytes) const noexcept {
        return bytes.size() == SIZE &&
               std::equal(bytes.begin(), bytes.end(), data_.begin());
    }
    
    /// Copy out as a byte vector
    std::vector<Byte> ToVector() const {
        return std::vector<Byte>(data_.begin(), data_.end());
    }
    
    /// Convert to hex string (storage byte order)
    std::string ToHex() const;
    
    /// Create from hex string
    /// @throws std::invalid_argument on bad length or characters
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

} // namespace sealbid

#endif // SEALBID_CORE_TYPES_H
