// SEALBID - SHA256 Hash Function
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by the OpenSSL EVP digest interface.

#ifndef SEALBID_CRYPTO_SHA256_H
#define SEALBID_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "sealbid/core/types.h"

// Forward declaration to keep OpenSSL headers out of the public API
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace sealbid {

/// SHA-256 hasher class
/// Provides incremental hashing; non-copyable since it owns an EVP context.
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    /// Default constructor - initializes to empty state
    /// @throws std::runtime_error if OpenSSL cannot allocate a digest context
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);
    
    /// Finalize the hash and write to output.
    /// The hasher is reset afterwards and may be reused.
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    /// @return Reference to this hasher (for chaining)
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256 hash of a string's bytes
inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace sealbid

#endif // SEALBID_CRYPTO_SHA256_H
