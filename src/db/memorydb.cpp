// SEALBID - In-Memory Database Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/db/memorydb.h"

namespace sealbid {
namespace db {

bool MemoryDatabase::ConsumeFailure() {
    if (failWrites_ > 0) {
        --failWrites_;
        return true;
    }
    return false;
}

Status MemoryDatabase::Get(const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions& /*options*/, const Slice& key,
                           const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ConsumeFailure()) {
        return Status::IOError("injected write failure");
    }
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions& /*options*/, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ConsumeFailure()) {
        return Status::IOError("injected write failure");
    }
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions& /*options*/, WriteBatch* batch) {
    if (!batch) {
        return Status::InvalidArgument("null batch");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (ConsumeFailure()) {
        return Status::IOError("injected write failure");
    }
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<MemoryIterator>(data_);
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    data_.clear();
}

void MemoryDatabase::FailNextWrites(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = count < 0 ? 0 : count;
}

} // namespace db
} // namespace sealbid
