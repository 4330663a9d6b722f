// SEALBID - In-Memory Database
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Ordered in-memory key-value store. Used for tests and for ephemeral
// ledgers (backend=memory).

#ifndef SEALBID_DB_MEMORYDB_H
#define SEALBID_DB_MEMORYDB_H

#include "sealbid/db/database.h"
#include <map>
#include <mutex>

namespace sealbid {
namespace db {

class MemoryDatabase : public Database {
private:
    std::map<std::string, std::string> data_;
    mutable std::mutex mutex_;
    
    /// Number of upcoming write calls that fail with IOError
    int failWrites_{0};
    
    /// Consume one injected failure, if any. Caller holds mutex_.
    bool ConsumeFailure();
    
public:
    MemoryDatabase() = default;
    
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    
    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator() override;
    
    const char* Name() const override { return "memory"; }
    
    size_t Size() const;
    void Clear();
    
    /**
     * Make the next `count` Put/Delete/Write calls fail with IOError
     * without touching the stored data. Used to exercise storage-failure
     * paths.
     */
    void FailNextWrites(int count);
};

/**
 * Iterator over a snapshot of a MemoryDatabase taken at creation.
 */
class MemoryIterator : public Iterator {
private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
    
public:
    explicit MemoryIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}
    
    bool Valid() const override { return iter_ != data_.end(); }
    
    void SeekToFirst() override { iter_ = data_.begin(); }
    
    void Seek(const Slice& target) override {
        iter_ = data_.lower_bound(target.ToString());
    }
    
    void Next() override {
        if (iter_ != data_.end()) {
            ++iter_;
        }
    }
    
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }
};

} // namespace db
} // namespace sealbid

#endif // SEALBID_DB_MEMORYDB_H
