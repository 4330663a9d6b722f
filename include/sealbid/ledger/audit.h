// SEALBID - Ledger Audit Events
// Copyright (c) 2024 SEALBID Developers
// MIT License
//
// Every successful ledger mutation is reported to an audit sink as an
// immutable event. Delivery is fire-and-forget: a failing sink never
// affects the operation that produced the event.

#ifndef SEALBID_LEDGER_AUDIT_H
#define SEALBID_LEDGER_AUDIT_H

#include "sealbid/core/types.h"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sealbid {
namespace ledger {

// ============================================================================
// Audit Event
// ============================================================================

/// Mutating operation recorded in an audit event
enum class AuditOperation : uint8_t {
    REGISTER_PROJECT = 0,
    PAUSE = 1,
    UNPAUSE = 2,
    SET_ADMIN = 3,
    SUBMIT_BID = 4,
    REVEAL_BID = 5,
    WITHDRAW_BID = 6,
};

/// Get string representation of an audit operation ("submit", ...)
const char* AuditOperationToString(AuditOperation op);

struct AuditEvent {
    AuditOperation operation{AuditOperation::PAUSE};
    
    /// Absent for ledger-wide operations (pause, unpause, setadmin)
    std::optional<ProjectId> projectId;
    
    Principal caller;
    BlockHeight height{0};
    
    /// Short description of the resulting state, e.g. "paused"
    std::string outcome;
    
    /// One-line rendering used by LogAuditSink
    std::string ToString() const;
};

// ============================================================================
// Audit Sinks
// ============================================================================

/**
 * Receiver of audit events. Implementations may throw; the ledger
 * contains and reports the failure.
 */
class IAuditSink {
public:
    virtual ~IAuditSink() = default;
    
    virtual void Record(const AuditEvent& event) = 0;
};

/// Writes events to the logger under the audit category
class LogAuditSink : public IAuditSink {
public:
    void Record(const AuditEvent& event) override;
};

/// Keeps events in memory in arrival order
class MemoryAuditSink : public IAuditSink {
public:
    void Record(const AuditEvent& event) override;
    
    std::vector<AuditEvent> GetEvents() const;
    size_t Count() const;
    void Clear();
    
private:
    mutable std::mutex mutex_;
    std::vector<AuditEvent> events_;
};

} // namespace ledger
} // namespace sealbid

#endif // SEALBID_LEDGER_AUDIT_H
