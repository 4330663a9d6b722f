// SEALBID - Sealed-Bid Ledger Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/ledger/ledger.h"
#include "sealbid/ledger/commitment.h"
#include "sealbid/util/logging.h"

#include <exception>

namespace sealbid {
namespace ledger {

BidLedger::BidLedger(std::unique_ptr<db::Database> database,
                     const LedgerOptions& options)
    : store_(std::move(database), options.syncWrites)
    , options_(options)
    , height_(options.initialHeight) {
    access_.admin = options.initialAdmin;
}

std::pair<db::Status, std::unique_ptr<BidLedger>> BidLedger::Open(
    std::unique_ptr<db::Database> database,
    const LedgerOptions& options)
{
    if (!database) {
        return {db::Status::InvalidArgument("no database"), nullptr};
    }
    auto ledger = std::make_unique<BidLedger>(std::move(database), options);
    db::Status s = ledger->Load();
    if (!s.ok()) {
        return {s, nullptr};
    }
    return {db::Status::Ok(), std::move(ledger)};
}

db::Status BidLedger::Load() {
    AccessControl ac;
    db::Status s = store_.ReadAccessControl(&ac);
    if (s.IsNotFound()) {
        ac.admin = options_.initialAdmin;
        ac.paused = false;
        s = store_.WriteAccessControl(ac);
    }
    if (!s.ok()) {
        return s;
    }
    
    BlockHeight height = 0;
    s = store_.ReadHeight(&height);
    if (s.IsNotFound()) {
        height = options_.initialHeight;
        s = store_.WriteHeight(height);
    }
    if (!s.ok()) {
        return s;
    }
    
    access_ = ac;
    height_ = height;
    return db::Status::Ok();
}

// ============================================================================
// Host Interface
// ============================================================================

bool BidLedger::SetHeight(BlockHeight height) {
    if (height < height_) {
        return false;
    }
    if (height == height_) {
        return true;
    }
    if (!store_.WriteHeight(height).ok()) {
        return false;
    }
    height_ = height;
    return true;
}

bool BidLedger::RegisterProject(ProjectId projectId) {
    if (store_.HasProject(projectId)) {
        return false;
    }
    if (!store_.CreateProject(projectId).ok()) {
        return false;
    }
    Emit(AuditOperation::REGISTER_PROJECT, projectId, "", "registered");
    return true;
}

bool BidLedger::HasProject(ProjectId projectId) {
    return store_.HasProject(projectId);
}

std::vector<ProjectId> BidLedger::ListProjects() {
    return store_.ListProjects();
}

// ============================================================================
// Access Control
// ============================================================================

LedgerResult BidLedger::UpdateAccess(const AccessControl& next) {
    if (!store_.WriteAccessControl(next).ok()) {
        return LedgerResult::Error(BidError::STORAGE_FAILURE);
    }
    access_ = next;
    return LedgerResult::Ok();
}

LedgerResult BidLedger::Pause(const Principal& caller) {
    if (caller != access_.admin) {
        return LedgerResult::Error(BidError::UNAUTHORIZED);
    }
    
    AccessControl next = access_;
    next.paused = true;
    LedgerResult result = UpdateAccess(next);
    if (result) {
        Emit(AuditOperation::PAUSE, std::nullopt, caller, "paused");
    }
    return result;
}

LedgerResult BidLedger::Unpause(const Principal& caller) {
    if (caller != access_.admin) {
        return LedgerResult::Error(BidError::UNAUTHORIZED);
    }
    
    AccessControl next = access_;
    next.paused = false;
    LedgerResult result = UpdateAccess(next);
    if (result) {
        Emit(AuditOperation::UNPAUSE, std::nullopt, caller, "unpaused");
    }
    return result;
}

LedgerResult BidLedger::SetAdmin(const Principal& caller, const Principal& newAdmin) {
    if (caller != access_.admin) {
        return LedgerResult::Error(BidError::UNAUTHORIZED);
    }
    if (access_.paused) {
        return LedgerResult::Error(BidError::PAUSED);
    }
    // Re-confirming the current admin is rejected
    if (newAdmin == caller) {
        return LedgerResult::Error(BidError::UNAUTHORIZED);
    }
    
    AccessControl next = access_;
    next.admin = newAdmin;
    LedgerResult result = UpdateAccess(next);
    if (result) {
        Emit(AuditOperation::SET_ADMIN, std::nullopt, caller, "admin=" + newAdmin);
    }
    return result;
}

// ============================================================================
// Bid Lifecycle
// ============================================================================

LedgerResult BidLedger::LoadProject(ProjectId projectId, ProjectBidList& list) {
    db::Status s = store_.ReadProjectBids(projectId, &list);
    if (s.IsNotFound()) {
        return LedgerResult::Error(BidError::PROJECT_NOT_FOUND);
    }
    if (!s.ok()) {
        return LedgerResult::Error(BidError::STORAGE_FAILURE);
    }
    return LedgerResult::Ok();
}

LedgerResult BidLedger::LoadBid(ProjectId projectId, const Principal& bidder,
                                BidRecord& record) {
    db::Status s = store_.ReadBid(projectId, bidder, &record);
    if (s.IsNotFound()) {
        return LedgerResult::Error(BidError::BID_NOT_FOUND);
    }
    if (!s.ok()) {
        return LedgerResult::Error(BidError::STORAGE_FAILURE);
    }
    return LedgerResult::Ok();
}

LedgerResult BidLedger::SubmitBid(const Principal& caller, ProjectId projectId,
                                  const std::vector<Byte>& commitment) {
    if (access_.paused) {
        return LedgerResult::Error(BidError::PAUSED);
    }
    
    ProjectBidList list;
    LedgerResult result = LoadProject(projectId, list);
    if (!result) {
        return result;
    }
    
    BidRecord existing;
    result = LoadBid(projectId, caller, existing);
    if (result) {
        return LedgerResult::Error(BidError::ALREADY_SUBMITTED);
    }
    if (result.GetError() != BidError::BID_NOT_FOUND) {
        return result;
    }
    
    if (!IsValidCommitmentSize(commitment)) {
        return LedgerResult::Error(BidError::INVALID_HASH);
    }
    
    if (list.IsFull()) {
        return LedgerResult::Error(BidError::BIDS_FULL);
    }
    
    Hash256 hash(commitment.data(), commitment.size());
    
    BidHeader header;
    header.bidder = caller;
    header.commitment = hash;
    header.submittedAt = height_;
    list.Append(std::move(header));
    
    if (!store_.InsertBid(projectId, list, caller, BidRecord::Sealed(hash)).ok()) {
        return LedgerResult::Error(BidError::STORAGE_FAILURE);
    }
    
    Emit(AuditOperation::SUBMIT_BID, projectId, caller, "commitment=" + hash.ToHex());
    return LedgerResult::Ok();
}

LedgerResult BidLedger::RevealBid(const Principal& caller, ProjectId projectId,
                                  BidAmount amount, const std::string& description,
                                  const std::vector<Byte>& commitment) {
    if (access_.paused) {
        return LedgerResult::Error(BidError::PAUSED);
    }
    
    ProjectBidList list;
    LedgerResult result = LoadProject(projectId, list);
    if (!result) {
        return result;
    }
    
    BidRecord record;
    result = LoadBid(projectId, caller, record);
    if (!result) {
        return result;
    }
    
    if (record.revealed) {
        return LedgerResult::Error(BidError::ALREADY_REVEALED);
    }
    
    // Supplied commitment must be the one stored at submission
    if (!record.commitment.Equals(commitment)) {
        return LedgerResult::Error(BidError::INVALID_REVEAL);
    }
    
    if (!VerifyBidCommitment(record.commitment, amount, description, caller)) {
        return LedgerResult::Error(BidError::INVALID_REVEAL);
    }
    
    if (!IsValidDescription(description)) {
        return LedgerResult::Error(BidError::INVALID_REVEAL);
    }
    
    record.amount = amount;
    record.description = description;
    record.revealed = true;
    record.revealedAt = height_;
    
    if (!store_.WriteBid(projectId, caller, record).ok()) {
        return LedgerResult::Error(BidError::STORAGE_FAILURE);
    }
    
    Emit(AuditOperation::REVEAL_BID, projectId, caller,
         "amount=" + std::to_string(amount));
    return LedgerResult::Ok();
}

LedgerResult BidLedger::WithdrawBid(const Principal& caller, ProjectId projectId) {
    if (access_.paused) {
        return LedgerResult::Error(BidError::PAUSED);
    }
    
    ProjectBidList list;
    LedgerResult result = LoadProject(projectId, list);
    if (!result) {
        return result;
    }
    
    BidRecord record;
    result = LoadBid(projectId, caller, record);
    if (!result) {
        return result;
    }
    
    // A revealed bid counts as opened
    if (record.revealed) {
        return LedgerResult::Error(BidError::ALREADY_OPENED);
    }
    
    list.Remove(caller);
    
    if (!store_.EraseBid(projectId, list, caller).ok()) {
        return LedgerResult::Error(BidError::STORAGE_FAILURE);
    }
    
    Emit(AuditOperation::WITHDRAW_BID, projectId, caller, "withdrawn");
    return LedgerResult::Ok();
}

// ============================================================================
// Queries
// ============================================================================

std::optional<BidRecord> BidLedger::GetBidDetails(ProjectId projectId,
                                                  const Principal& bidder) {
    BidRecord record;
    if (!store_.ReadBid(projectId, bidder, &record).ok()) {
        return std::nullopt;
    }
    return record;
}

std::optional<ProjectBidList> BidLedger::GetProjectBids(ProjectId projectId) {
    ProjectBidList list;
    if (!store_.ReadProjectBids(projectId, &list).ok()) {
        return std::nullopt;
    }
    return list;
}

size_t BidLedger::GetBidCount(ProjectId projectId) {
    auto list = GetProjectBids(projectId);
    return list ? list->Size() : 0;
}

// ============================================================================
// Audit
// ============================================================================

void BidLedger::Emit(AuditOperation op, std::optional<ProjectId> projectId,
                     const Principal& caller, std::string outcome) {
    if (!auditSink_) {
        return;
    }
    
    AuditEvent event;
    event.operation = op;
    event.projectId = projectId;
    event.caller = caller;
    event.height = height_;
    event.outcome = std::move(outcome);
    
    try {
        auditSink_->Record(event);
    } catch (const std::exception& e) {
        LOG_WARN(util::LogCategory::LEDGER) << "Audit sink rejected "
            << AuditOperationToString(op) << " event: " << e.what();
    }
}

} // namespace ledger
} // namespace sealbid
