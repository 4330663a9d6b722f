// SEALBID - Database Abstraction Layer
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Abstract key-value store used by the bid ledger. Backends:
// MemoryDatabase (always available) and LevelDBDatabase (when the build
// found LevelDB).

#ifndef SEALBID_DB_DATABASE_H
#define SEALBID_DB_DATABASE_H

#include "sealbid/core/types.h"
#include "sealbid/core/serialize.h"
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sealbid {
namespace db {

// ============================================================================
// Status
// ============================================================================

/**
 * Outcome of a storage call. Backends translate their native errors into
 * one of these codes; the message carries the backend's own text.
 */
class Status {
public:
    enum class Code {
        OK,
        NOT_FOUND,
        CORRUPTION,
        NOT_SUPPORTED,
        INVALID_ARGUMENT,
        IO_ERROR,
    };
    
    Status() = default;
    Status(Code code, std::string message)
        : code_(code), message_(std::move(message)) {}
    
    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = {}) { return {Code::NOT_FOUND, std::move(msg)}; }
    static Status Corruption(std::string msg = {}) { return {Code::CORRUPTION, std::move(msg)}; }
    static Status NotSupported(std::string msg = {}) { return {Code::NOT_SUPPORTED, std::move(msg)}; }
    static Status InvalidArgument(std::string msg = {}) { return {Code::INVALID_ARGUMENT, std::move(msg)}; }
    static Status IOError(std::string msg = {}) { return {Code::IO_ERROR, std::move(msg)}; }
    
    bool ok() const { return code_ == Code::OK; }
    bool IsNotFound() const { return code_ == Code::NOT_FOUND; }
    bool IsCorruption() const { return code_ == Code::CORRUPTION; }
    bool IsNotSupported() const { return code_ == Code::NOT_SUPPORTED; }
    bool IsInvalidArgument() const { return code_ == Code::INVALID_ARGUMENT; }
    bool IsIOError() const { return code_ == Code::IO_ERROR; }
    
    Code code() const { return code_; }
    const std::string& message() const { return message_; }
    
    /// "NotFound: message", or "OK"
    std::string ToString() const;

private:
    Code code_{Code::OK};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Borrowed byte range; the owner must outlive it
class Slice {
public:
    Slice() = default;
    Slice(const char* data, size_t size) : data_(data), size_(size) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}
    
    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    
    std::string ToString() const { return std::string(data_, size_); }
    
    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ &&
               std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }
    
    friend bool operator==(const Slice& a, const Slice& b) {
        return a.size_ == b.size_ && std::memcmp(a.data_, b.data_, a.size_) == 0;
    }
    friend bool operator!=(const Slice& a, const Slice& b) { return !(a == b); }

private:
    const char* data_{""};
    size_t size_{0};
};

// ============================================================================
// Options
// ============================================================================

/// Settings for opening an on-disk ledger database
struct Options {
    bool create_if_missing = true;
    
    /// Fail the open on any sign of corruption
    bool paranoid_checks = true;
    
    /// Block cache in bytes (0 disables)
    size_t block_cache_size = 4 * 1024 * 1024;
    
    /// Bloom filter bits per key (0 disables)
    int bloom_filter_bits = 10;
};

struct WriteOptions {
    /// fsync before the write returns
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Puts and deletes applied together or not at all
class WriteBatch {
public:
    void Put(const Slice& key, const Slice& value) {
        ops_.emplace_back(key.ToString(), value.ToString());
    }
    
    void Delete(const Slice& key) {
        ops_.emplace_back(key.ToString(), std::nullopt);
    }
    
    void Clear() { ops_.clear(); }
    size_t Count() const { return ops_.size(); }
    bool Empty() const { return ops_.empty(); }
    
    /// Calls func(key, value) in insertion order; value is nullopt for deletes
    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& op : ops_) {
            func(op.first, op.second);
        }
    }

private:
    std::vector<std::pair<std::string, std::optional<std::string>>> ops_;
};

// ============================================================================
// Iterator
// ============================================================================

/// Forward cursor over keys in byte order
class Iterator {
public:
    virtual ~Iterator() = default;
    
    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;
    
    /// NotFound when the key is absent
    virtual Status Get(const Slice& key, std::string* value) = 0;
    
    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    
    Status Put(const Slice& key, const Slice& value) { return Put(WriteOptions(), key, value); }
    Status Delete(const Slice& key) { return Delete(WriteOptions(), key); }
    Status Write(WriteBatch* batch) { return Write(WriteOptions(), batch); }
    
    virtual std::unique_ptr<Iterator> NewIterator() = 0;
    
    bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
    
    /// "memory" or "leveldb"
    virtual const char* Name() const = 0;
};

// ============================================================================
// Database Factory Functions
// ============================================================================

/**
 * Open the on-disk database at path. Returns NotSupported when the build
 * has no LevelDB backend.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Create an empty in-memory database
std::unique_ptr<Database> CreateMemoryDatabase();

/// Whether OpenDatabase can succeed in this build
bool HasPersistentBackend();

/// Delete an on-disk database and all its data
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Serialization Helpers
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    Serialize(ss, obj);
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/**
 * Deserialize an object from a byte string.
 * Fails on truncated input or trailing bytes.
 */
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
        Unserialize(ss, obj);
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // namespace db
} // namespace sealbid

#endif // SEALBID_DB_DATABASE_H
