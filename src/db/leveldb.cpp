// SEALBID - LevelDB Backend Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/db/leveldb.h"

namespace sealbid {
namespace db {

Status ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsIOError()) return Status::IOError(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

namespace {

leveldb::ReadOptions MakeReadOptions(bool verifyChecksums) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = verifyChecksums;
    return lo;
}

leveldb::WriteOptions MakeWriteOptions(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // anonymous namespace

// ============================================================================
// LevelDBDatabase
// ============================================================================

LevelDBDatabase::~LevelDBDatabase() {
    // DB must close before the cache and filter it references
    db_.reset();
    cache_.reset();
    filterPolicy_.reset();
}

Status LevelDBDatabase::Get(const Slice& key, std::string* value) {
    leveldb::Slice lkey(key.data(), key.size());
    return ConvertStatus(db_->Get(MakeReadOptions(verifyChecksums_), lkey, value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key,
                            const Slice& value) {
    leveldb::Slice lkey(key.data(), key.size());
    leveldb::Slice lval(value.data(), value.size());
    return ConvertStatus(db_->Put(MakeWriteOptions(options), lkey, lval));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    leveldb::Slice lkey(key.data(), key.size());
    return ConvertStatus(db_->Delete(MakeWriteOptions(options), lkey));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    if (!batch) {
        return Status::InvalidArgument("null batch");
    }
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return ConvertStatus(db_->Write(MakeWriteOptions(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator() {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(MakeReadOptions(verifyChecksums_)));
}

// ============================================================================
// Open / Destroy
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenLevelDB(
    const std::filesystem::path& path, const Options& options)
{
    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.paranoid_checks = options.paranoid_checks;
    
    leveldb::Cache* cache = nullptr;
    if (options.block_cache_size > 0) {
        cache = leveldb::NewLRUCache(options.block_cache_size);
        lo.block_cache = cache;
    }
    
    const leveldb::FilterPolicy* filter = nullptr;
    if (options.bloom_filter_bits > 0) {
        filter = leveldb::NewBloomFilterPolicy(options.bloom_filter_bits);
        lo.filter_policy = filter;
    }
    
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec) {
            delete cache;
            delete filter;
            return {Status::IOError(ec.message()), nullptr};
        }
    }
    
    leveldb::DB* db = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &db);
    if (!s.ok()) {
        delete cache;
        delete filter;
        return {ConvertStatus(s), nullptr};
    }
    
    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(db, cache, filter, path,
                                              options.paranoid_checks)};
}

Status DestroyLevelDB(const std::filesystem::path& path) {
    return ConvertStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace sealbid
