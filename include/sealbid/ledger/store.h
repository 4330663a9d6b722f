// SEALBID - Bid Store
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Typed persistence of ledger state on top of the key-value database.
//
// Key layout:
//   'P' <project:8 BE>            -> ProjectBidList
//   'B' <project:8 BE> <bidder>   -> BidRecord
//   'A'                           -> AccessControl
//   'H'                           -> current height (uint64)

#ifndef SEALBID_LEDGER_STORE_H
#define SEALBID_LEDGER_STORE_H

#include "sealbid/db/database.h"
#include "sealbid/ledger/bid.h"

#include <memory>
#include <string>
#include <vector>

namespace sealbid {
namespace ledger {

// ============================================================================
// Key Prefixes
// ============================================================================

namespace prefix {
    constexpr char PROJECT = 'P';
    constexpr char BID = 'B';
    constexpr char ACCESS = 'A';
    constexpr char HEIGHT = 'H';
}

/// Key of a project's bid list
std::string ProjectKey(ProjectId projectId);

/// Key of a bid record
std::string BidKey(ProjectId projectId, const Principal& bidder);

// ============================================================================
// Access Control
// ============================================================================

/// Ledger-wide administrative state
struct AccessControl {
    Principal admin;
    bool paused{false};
    
    bool operator==(const AccessControl& other) const {
        return admin == other.admin && paused == other.paused;
    }
    bool operator!=(const AccessControl& other) const { return !(*this == other); }
};

template<typename Stream>
void Serialize(Stream& s, const AccessControl& ac) {
    ::sealbid::Serialize(s, ac.admin);
    ::sealbid::Serialize(s, ac.paused);
}

template<typename Stream>
void Unserialize(Stream& s, AccessControl& ac) {
    ::sealbid::Unserialize(s, ac.admin);
    ::sealbid::Unserialize(s, ac.paused);
}

// ============================================================================
// BidStore
// ============================================================================

/**
 * Reads return NotFound for absent keys and Corruption for values that
 * fail to decode. Writes touching more than one key go through a single
 * WriteBatch.
 */
class BidStore {
public:
    explicit BidStore(std::unique_ptr<db::Database> database,
                      bool syncWrites = false);
    
    BidStore(const BidStore&) = delete;
    BidStore& operator=(const BidStore&) = delete;
    
    // ========================================================================
    // Projects
    // ========================================================================
    
    bool HasProject(ProjectId projectId);
    
    db::Status ReadProjectBids(ProjectId projectId, ProjectBidList* list);
    
    /// Store an empty bid list for a new project
    db::Status CreateProject(ProjectId projectId);
    
    /// Registered projects in ascending order
    std::vector<ProjectId> ListProjects();
    
    // ========================================================================
    // Bids
    // ========================================================================
    
    db::Status ReadBid(ProjectId projectId, const Principal& bidder, BidRecord* record);
    
    /// Overwrite an existing record (reveal)
    db::Status WriteBid(ProjectId projectId, const Principal& bidder,
                        const BidRecord& record);
    
    /// Store the updated list and a new record together (submit)
    db::Status InsertBid(ProjectId projectId, const ProjectBidList& list,
                         const Principal& bidder, const BidRecord& record);
    
    /// Store the updated list and delete the record together (withdraw)
    db::Status EraseBid(ProjectId projectId, const ProjectBidList& list,
                        const Principal& bidder);
    
    // ========================================================================
    // Ledger State
    // ========================================================================
    
    db::Status ReadAccessControl(AccessControl* ac);
    db::Status WriteAccessControl(const AccessControl& ac);
    
    db::Status ReadHeight(BlockHeight* height);
    db::Status WriteHeight(BlockHeight height);
    
    db::Database& GetDatabase() { return *db_; }
    
private:
    std::unique_ptr<db::Database> db_;
    db::WriteOptions writeOptions_;
    
    /// Get and decode a value; logs decode failures
    template<typename T>
    db::Status ReadValue(const std::string& key, T& value);
    
    db::Status Commit(db::WriteBatch& batch);
};

} // namespace ledger
} // namespace sealbid

#endif // SEALBID_LEDGER_STORE_H
