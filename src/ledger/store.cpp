// SEALBID - Bid Store Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/ledger/store.h"
#include "sealbid/util/logging.h"

namespace sealbid {
namespace ledger {

namespace {

void AppendProjectId(std::string& key, ProjectId projectId) {
    for (int i = 7; i >= 0; --i) {
        key.push_back(static_cast<char>((projectId >> (8 * i)) & 0xFF));
    }
}

ProjectId ParseProjectId(const char* data) {
    ProjectId id = 0;
    for (int i = 0; i < 8; ++i) {
        id = (id << 8) | static_cast<uint8_t>(data[i]);
    }
    return id;
}

} // anonymous namespace

std::string ProjectKey(ProjectId projectId) {
    std::string key(1, prefix::PROJECT);
    AppendProjectId(key, projectId);
    return key;
}

std::string BidKey(ProjectId projectId, const Principal& bidder) {
    std::string key(1, prefix::BID);
    AppendProjectId(key, projectId);
    key += bidder;
    return key;
}

// ============================================================================
// BidStore
// ============================================================================

BidStore::BidStore(std::unique_ptr<db::Database> database, bool syncWrites)
    : db_(std::move(database)) {
    writeOptions_.sync = syncWrites;
}

template<typename T>
db::Status BidStore::ReadValue(const std::string& key, T& value) {
    std::string raw;
    db::Status s = db_->Get(key, &raw);
    if (!s.ok()) {
        if (!s.IsNotFound()) {
            LOG_ERROR(util::LogCategory::DB) << "Read failed: " << s.ToString();
        }
        return s;
    }
    if (!db::DeserializeFromString(raw, value)) {
        LOG_ERROR(util::LogCategory::DB) << "Undecodable value under key prefix '"
                                         << key[0] << "' (" << raw.size() << " bytes)";
        return db::Status::Corruption("undecodable value");
    }
    return db::Status::Ok();
}

db::Status BidStore::Commit(db::WriteBatch& batch) {
    db::Status s = db_->Write(writeOptions_, &batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Batch write of " << batch.Count()
                                         << " operations failed: " << s.ToString();
    }
    return s;
}

bool BidStore::HasProject(ProjectId projectId) {
    return db_->Exists(ProjectKey(projectId));
}

db::Status BidStore::ReadProjectBids(ProjectId projectId, ProjectBidList* list) {
    return ReadValue(ProjectKey(projectId), *list);
}

db::Status BidStore::CreateProject(ProjectId projectId) {
    db::WriteBatch batch;
    batch.Put(ProjectKey(projectId), db::SerializeToString(ProjectBidList()));
    return Commit(batch);
}

std::vector<ProjectId> BidStore::ListProjects() {
    std::vector<ProjectId> projects;
    auto iter = db_->NewIterator();
    std::string start(1, prefix::PROJECT);
    
    for (iter->Seek(start); iter->Valid(); iter->Next()) {
        db::Slice key = iter->key();
        if (key.empty() || key.data()[0] != prefix::PROJECT) {
            break;
        }
        if (key.size() != 9) {
            LOG_WARN(util::LogCategory::DB) << "Skipping malformed project key";
            continue;
        }
        projects.push_back(ParseProjectId(key.data() + 1));
    }
    
    if (!iter->status().ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Project scan failed: "
                                         << iter->status().ToString();
    }
    return projects;
}

db::Status BidStore::ReadBid(ProjectId projectId, const Principal& bidder,
                             BidRecord* record) {
    return ReadValue(BidKey(projectId, bidder), *record);
}

db::Status BidStore::WriteBid(ProjectId projectId, const Principal& bidder,
                              const BidRecord& record) {
    db::WriteBatch batch;
    batch.Put(BidKey(projectId, bidder), db::SerializeToString(record));
    return Commit(batch);
}

db::Status BidStore::InsertBid(ProjectId projectId, const ProjectBidList& list,
                               const Principal& bidder, const BidRecord& record) {
    db::WriteBatch batch;
    batch.Put(ProjectKey(projectId), db::SerializeToString(list));
    batch.Put(BidKey(projectId, bidder), db::SerializeToString(record));
    return Commit(batch);
}

db::Status BidStore::EraseBid(ProjectId projectId, const ProjectBidList& list,
                              const Principal& bidder) {
    db::WriteBatch batch;
    batch.Put(ProjectKey(projectId), db::SerializeToString(list));
    batch.Delete(BidKey(projectId, bidder));
    return Commit(batch);
}

db::Status BidStore::ReadAccessControl(AccessControl* ac) {
    return ReadValue(std::string(1, prefix::ACCESS), *ac);
}

db::Status BidStore::WriteAccessControl(const AccessControl& ac) {
    db::WriteBatch batch;
    batch.Put(std::string(1, prefix::ACCESS), db::SerializeToString(ac));
    return Commit(batch);
}

db::Status BidStore::ReadHeight(BlockHeight* height) {
    return ReadValue(std::string(1, prefix::HEIGHT), *height);
}

db::Status BidStore::WriteHeight(BlockHeight height) {
    db::WriteBatch batch;
    batch.Put(std::string(1, prefix::HEIGHT), db::SerializeToString(height));
    return Commit(batch);
}

} // namespace ledger
} // namespace sealbid
