// SEALBID - Ledger Audit Events Implementation
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include "sealbid/ledger/audit.h"
#include "sealbid/util/logging.h"

#include <sstream>

namespace sealbid {
namespace ledger {

const char* AuditOperationToString(AuditOperation op) {
    switch (op) {
        case AuditOperation::REGISTER_PROJECT: return "register";
        case AuditOperation::PAUSE: return "pause";
        case AuditOperation::UNPAUSE: return "unpause";
        case AuditOperation::SET_ADMIN: return "setadmin";
        case AuditOperation::SUBMIT_BID: return "submit";
        case AuditOperation::REVEAL_BID: return "reveal";
        case AuditOperation::WITHDRAW_BID: return "withdraw";
    }
    return "unknown";
}

std::string AuditEvent::ToString() const {
    std::ostringstream oss;
    oss << AuditOperationToString(operation);
    if (projectId) {
        oss << " project=" << *projectId;
    }
    oss << " caller=" << caller
        << " height=" << height
        << " outcome=" << outcome;
    return oss.str();
}

// ============================================================================
// LogAuditSink
// ============================================================================

void LogAuditSink::Record(const AuditEvent& event) {
    LOG_INFO(util::LogCategory::AUDIT) << event.ToString();
}

// ============================================================================
// MemoryAuditSink
// ============================================================================

void MemoryAuditSink::Record(const AuditEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
}

std::vector<AuditEvent> MemoryAuditSink::GetEvents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t MemoryAuditSink::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void MemoryAuditSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

} // namespace ledger
} // namespace sealbid
