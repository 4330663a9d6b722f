// SEALBID - LevelDB Wrapper
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// LevelDB implementation of the database interface. Only compiled when the
// build found LevelDB (SEALBID_USE_LEVELDB).

#ifndef SEALBID_DB_LEVELDB_H
#define SEALBID_DB_LEVELDB_H

#include "sealbid/db/database.h"

#include <leveldb/db.h>
#include <leveldb/write_batch.h>
#include <leveldb/cache.h>
#include <leveldb/filter_policy.h>

namespace sealbid {
namespace db {

/// Map a LevelDB status onto ours
Status ConvertStatus(const leveldb::Status& s);

// ============================================================================
// LevelDB Iterator Wrapper
// ============================================================================

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;
    
public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}
    
    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }
    
    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }
    
    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }
    
    Status status() const override { return ConvertStatus(iter_->status()); }
};

// ============================================================================
// LevelDB Database Implementation
// ============================================================================

class LevelDBDatabase : public Database {
private:
    std::unique_ptr<leveldb::DB> db_;
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::filesystem::path path_;
    
    /// Reads verify block checksums (set from Options::paranoid_checks)
    bool verifyChecksums_;
    
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter,
                    const std::filesystem::path& path,
                    bool verifyChecksums)
        : db_(db), cache_(cache), filterPolicy_(filter), path_(path)
        , verifyChecksums_(verifyChecksums) {}
    
    ~LevelDBDatabase() override;
    
    using Database::Put;
    using Database::Delete;
    using Database::Write;
    
    Status Get(const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator() override;
    
    const char* Name() const override { return "leveldb"; }
    
    const std::filesystem::path& GetPath() const { return path_; }
};

/// Open a LevelDB database; used by OpenDatabase
std::pair<Status, std::unique_ptr<Database>> OpenLevelDB(
    const std::filesystem::path& path, const Options& options);

/// Remove all LevelDB files at path; used by DestroyDatabase
Status DestroyLevelDB(const std::filesystem::path& path);

} // namespace db
} // namespace sealbid

#endif // SEALBID_DB_LEVELDB_H
