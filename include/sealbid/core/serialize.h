// SEALBID - Serialization Header
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Serialization primitives for ledger records stored in the key-value
// backend. Integers are little-endian, strings and vectors carry a
// CompactSize length prefix. The big-endian writer exists only for the
// bid commitment pre-image, whose layout is fixed externally.

#ifndef SEALBID_CORE_SERIALIZE_H
#define SEALBID_CORE_SERIALIZE_H

#include "sealbid/core/types.h"
#include "sealbid/core/hex.h"
#include <algorithm>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <vector>
#include <string>
#include <array>
#include <stdexcept>
#include <ios>
#include <optional>
#include <type_traits>

namespace sealbid {

// ============================================================================
// Constants
// ============================================================================

/// Largest length prefix accepted when decoding (32 MiB)
static constexpr uint64_t MAX_SIZE = 0x02000000;

/// Upper bound on elements reserved ahead of decoding a vector
static constexpr uint64_t MAX_VECTOR_RESERVE = 1024;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;

public:
    DataStream() = default;
    
    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}
    
    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)), read_pos_(0) {}
    
    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}
    
    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }
    
    bool empty() const noexcept { return size() == 0; }
    
    void clear() {
        data_.clear();
        read_pos_ = 0;
    }
    
    /// Get pointer to unread data
    const uint8_t* data() const noexcept { return data_.data() + read_pos_; }
    
    /// Full underlying buffer
    const std::vector<uint8_t>& Data() const noexcept { return data_; }
    
    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }
    
    void Write(const char* src, size_type len) {
        Write(reinterpret_cast<const uint8_t*>(src), len);
    }
    
    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        std::memcpy(dst, data_.data() + read_pos_, len);
        read_pos_ += len;
    }
    
    void Read(char* dst, size_type len) {
        Read(reinterpret_cast<uint8_t*>(dst), len);
    }
    
    std::string ToHex() const { return BytesToHex(data(), size()); }
    
    template<typename T>
    DataStream& operator<<(const T& obj);
    
    template<typename T>
    DataStream& operator>>(T& obj);
};

// ============================================================================
// Fixed-Width Integers
// ============================================================================

/// Write an unsigned integer least significant byte first
template<typename T, typename Stream>
inline void WriteLE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteLE needs an unsigned type");
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

/// Write an unsigned integer most significant byte first
template<typename T, typename Stream>
inline void WriteBE(Stream& s, T value) {
    static_assert(std::is_unsigned<T>::value, "WriteBE needs an unsigned type");
    uint8_t buf[sizeof(T)];
    for (size_t i = 0; i < sizeof(T); ++i) {
        buf[sizeof(T) - 1 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(buf, sizeof(T));
}

template<typename T, typename Stream>
inline T ReadLE(Stream& s) {
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = sizeof(T); i > 0; --i) {
        value = static_cast<T>((value << 8) | buf[i - 1]);
    }
    return value;
}

template<typename T, typename Stream>
inline T ReadBE(Stream& s) {
    uint8_t buf[sizeof(T)];
    s.Read(buf, sizeof(T));
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | buf[i]);
    }
    return value;
}

// ============================================================================
// CompactSize
// ============================================================================
// One byte below 0xFD, otherwise a marker byte (FD, FE, FF) followed by a
// 2, 4 or 8 byte little-endian length.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t size) {
    if (size < 253) {
        WriteLE<uint8_t>(s, static_cast<uint8_t>(size));
    } else if (size <= 0xFFFF) {
        WriteLE<uint8_t>(s, 0xFD);
        WriteLE<uint16_t>(s, static_cast<uint16_t>(size));
    } else if (size <= 0xFFFFFFFF) {
        WriteLE<uint8_t>(s, 0xFE);
        WriteLE<uint32_t>(s, static_cast<uint32_t>(size));
    } else {
        WriteLE<uint8_t>(s, 0xFF);
        WriteLE<uint64_t>(s, size);
    }
}

/// Read a CompactSize; the shortest encoding is required
template<typename Stream>
uint64_t ReadCompactSize(Stream& s) {
    uint8_t marker = ReadLE<uint8_t>(s);
    if (marker < 0xFD) {
        return marker;
    }
    
    uint64_t size = 0;
    uint64_t floor = 0;
    if (marker == 0xFD) {
        size = ReadLE<uint16_t>(s);
        floor = 0xFD;
    } else if (marker == 0xFE) {
        size = ReadLE<uint32_t>(s);
        floor = 0x10000;
    } else {
        size = ReadLE<uint64_t>(s);
        floor = 0x100000000ULL;
    }
    
    if (size < floor) {
        throw std::ios_base::failure("ReadCompactSize(): non-canonical encoding");
    }
    if (size > MAX_SIZE) {
        throw std::ios_base::failure("ReadCompactSize(): size too large");
    }
    return size;
}

// ============================================================================
// Serialize/Unserialize for Basic Types
// ============================================================================

template<typename Stream>
inline void Serialize(Stream& s, uint8_t a) { WriteLE<uint8_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint8_t& a) { a = ReadLE<uint8_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint32_t a) { WriteLE<uint32_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint32_t& a) { a = ReadLE<uint32_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, uint64_t a) { WriteLE<uint64_t>(s, a); }

template<typename Stream>
inline void Unserialize(Stream& s, uint64_t& a) { a = ReadLE<uint64_t>(s); }

template<typename Stream>
inline void Serialize(Stream& s, bool a) { WriteLE<uint8_t>(s, a ? 1 : 0); }

template<typename Stream>
inline void Unserialize(Stream& s, bool& a) {
    uint8_t v = ReadLE<uint8_t>(s);
    if (v > 1) {
        throw std::ios_base::failure("non-canonical boolean");
    }
    a = (v != 0);
}

// ============================================================================
// Serialize/Unserialize for Strings and Byte Vectors
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    if (!str.empty()) {
        s.Write(str.data(), str.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    uint64_t size = ReadCompactSize(s);
    str.resize(size);
    if (size > 0) {
        s.Read(&str[0], size);
    }
}

template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    if (!v.empty()) {
        s.Write(v.data(), v.size());
    }
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    uint64_t size = ReadCompactSize(s);
    v.resize(size);
    if (size > 0) {
        s.Read(v.data(), size);
    }
}

// ============================================================================
// Serialize/Unserialize for Hash Types
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const Hash256& hash) {
    s.Write(hash.data(), Hash256::SIZE);
}

template<typename Stream>
void Unserialize(Stream& s, Hash256& hash) {
    s.Read(hash.data(), Hash256::SIZE);
}

// ============================================================================
// Serialize/Unserialize for Optionals (1-byte presence flag)
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::optional<T>& opt) {
    Serialize(s, opt.has_value());
    if (opt) {
        Serialize(s, *opt);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::optional<T>& opt) {
    bool present = false;
    Unserialize(s, present);
    if (present) {
        T value{};
        Unserialize(s, value);
        opt = std::move(value);
    } else {
        opt.reset();
    }
}

// ============================================================================
// Serialize/Unserialize for Generic Vectors
// ============================================================================

template<typename Stream, typename T>
void Serialize(Stream& s, const std::vector<T>& v) {
    WriteCompactSize(s, v.size());
    for (const auto& item : v) {
        Serialize(s, item);
    }
}

template<typename Stream, typename T>
void Unserialize(Stream& s, std::vector<T>& v) {
    uint64_t size = ReadCompactSize(s);
    v.clear();
    v.reserve(static_cast<size_t>(std::min(size, MAX_VECTOR_RESERVE)));
    for (uint64_t i = 0; i < size; ++i) {
        T item;
        Unserialize(s, item);
        v.push_back(std::move(item));
    }
}

// ============================================================================
// DataStream Stream Operators Implementation
// ============================================================================

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace sealbid

#endif // SEALBID_CORE_SERIALIZE_H
