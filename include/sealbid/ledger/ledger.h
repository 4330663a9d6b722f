// SEALBID - Sealed-Bid Ledger
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Commit-reveal bid ledger. Contractors submit a 32-byte commitment to a
// bid, later reveal the amount and description, and the ledger accepts
// the reveal only if the content hashes to the stored commitment.
//
// Operations are applied one at a time in the order the host supplies
// them; the ledger does no locking of its own. Each mutating operation
// either succeeds completely or returns an error with no state change.

#ifndef SEALBID_LEDGER_LEDGER_H
#define SEALBID_LEDGER_LEDGER_H

#include "sealbid/core/types.h"
#include "sealbid/db/database.h"
#include "sealbid/ledger/audit.h"
#include "sealbid/ledger/bid.h"
#include "sealbid/ledger/errors.h"
#include "sealbid/ledger/store.h"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sealbid {
namespace ledger {

/// Default admin of a freshly created ledger
constexpr const char* DEFAULT_ADMIN = "deployer";

struct LedgerOptions {
    /// Admin used when the store holds no access-control state yet
    Principal initialAdmin{DEFAULT_ADMIN};
    
    /// Height used when the store holds no height yet
    BlockHeight initialHeight{0};
    
    /// Sync every write to disk
    bool syncWrites{false};
};

// ============================================================================
// BidLedger
// ============================================================================

class BidLedger {
public:
    /// Create a ledger over a database. Call Load() before use.
    BidLedger(std::unique_ptr<db::Database> database,
              const LedgerOptions& options = LedgerOptions());
    
    BidLedger(const BidLedger&) = delete;
    BidLedger& operator=(const BidLedger&) = delete;
    
    /**
     * Construct and load a ledger.
     * @return Pair of (status, ledger); ledger is null when loading failed
     */
    static std::pair<db::Status, std::unique_ptr<BidLedger>> Open(
        std::unique_ptr<db::Database> database,
        const LedgerOptions& options = LedgerOptions());
    
    /**
     * Read access control and height from the store. A store without them
     * is initialised from the options and written back.
     */
    db::Status Load();
    
    // ========================================================================
    // Host Interface
    // ========================================================================
    
    /// Advance the logical clock. Returns false if height would go back.
    bool SetHeight(BlockHeight height);
    
    BlockHeight GetHeight() const { return height_; }
    
    /**
     * Register a project with an empty bid list. Called by the project
     * registry; not subject to admin checks or the pause flag.
     * @return false if the project exists or the write failed
     */
    bool RegisterProject(ProjectId projectId);
    
    bool HasProject(ProjectId projectId);
    
    /// Registered projects in ascending order
    std::vector<ProjectId> ListProjects();
    
    /// Receiver for audit events; nullptr disables auditing. Not owned.
    void SetAuditSink(IAuditSink* sink) { auditSink_ = sink; }
    
    // ========================================================================
    // Access Control
    // ========================================================================
    
    LedgerResult Pause(const Principal& caller);
    LedgerResult Unpause(const Principal& caller);
    
    /// Transfer adminship. Rejected while paused and when newAdmin == caller.
    LedgerResult SetAdmin(const Principal& caller, const Principal& newAdmin);
    
    // ========================================================================
    // Bid Lifecycle
    // ========================================================================
    
    /**
     * Submit a sealed bid.
     *
     * Checks, first failure wins: PAUSED, PROJECT_NOT_FOUND,
     * ALREADY_SUBMITTED, INVALID_HASH, BIDS_FULL.
     */
    LedgerResult SubmitBid(const Principal& caller, ProjectId projectId,
                           const std::vector<Byte>& commitment);
    
    /**
     * Reveal a sealed bid.
     *
     * Checks, first failure wins: PAUSED, PROJECT_NOT_FOUND, BID_NOT_FOUND,
     * ALREADY_REVEALED, then INVALID_REVEAL when the supplied commitment
     * differs from the stored one, when the content does not hash to it,
     * or when the description is too long or not UTF-8.
     */
    LedgerResult RevealBid(const Principal& caller, ProjectId projectId,
                           BidAmount amount, const std::string& description,
                           const std::vector<Byte>& commitment);
    
    /// Withdraw an unrevealed bid, removing both header and record
    LedgerResult WithdrawBid(const Principal& caller, ProjectId projectId);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    std::optional<BidRecord> GetBidDetails(ProjectId projectId, const Principal& bidder);
    
    std::optional<ProjectBidList> GetProjectBids(ProjectId projectId);
    
    /// Number of live bids on a project (0 if unknown)
    size_t GetBidCount(ProjectId projectId);
    
    bool IsPaused() const { return access_.paused; }
    
    const Principal& GetAdmin() const { return access_.admin; }
    
    /// Underlying database
    db::Database& GetDatabase() { return store_.GetDatabase(); }
    
private:
    BidStore store_;
    LedgerOptions options_;
    AccessControl access_;
    BlockHeight height_{0};
    IAuditSink* auditSink_{nullptr};
    
    /// Fetch the project list; PROJECT_NOT_FOUND or STORAGE_FAILURE on error
    LedgerResult LoadProject(ProjectId projectId, ProjectBidList& list);
    
    /// Fetch a bid; BID_NOT_FOUND or STORAGE_FAILURE on error
    LedgerResult LoadBid(ProjectId projectId, const Principal& bidder, BidRecord& record);
    
    /// Persist access control, then adopt it
    LedgerResult UpdateAccess(const AccessControl& next);
    
    void Emit(AuditOperation op, std::optional<ProjectId> projectId,
              const Principal& caller, std::string outcome);
};

} // namespace ledger
} // namespace sealbid

#endif // SEALBID_LEDGER_LEDGER_H
