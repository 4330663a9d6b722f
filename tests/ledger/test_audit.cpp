// SEALBID - Ledger Audit Tests
// Copyright (c) 2024 SEALBID Developers
// MIT License

#include <gtest/gtest.h>
#include "sealbid/db/memorydb.h"
#include "sealbid/ledger/audit.h"
#include "sealbid/ledger/commitment.h"
#include "sealbid/ledger/ledger.h"
#include "sealbid/util/logging.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace sealbid {
namespace ledger {
namespace test {

namespace {

/// Sink that always fails
class ThrowingAuditSink : public IAuditSink {
public:
    void Record(const AuditEvent&) override {
        ++calls;
        throw std::runtime_error("audit log unavailable");
    }
    
    int calls{0};
};

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

class AuditTest : public ::testing::Test {
protected:
    void SetUp() override {
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
        util::Logger::Instance().EnableAllCategories();
        util::Logger::Instance().ClearCategoryLevels();
        
        auto opened = BidLedger::Open(std::make_unique<db::MemoryDatabase>());
        ASSERT_TRUE(opened.first.ok());
        ledger_ = std::move(opened.second);
        ASSERT_TRUE(ledger_->SetHeight(42));
        ledger_->SetAuditSink(&sink_);
    }
    
    void TearDown() override {
        util::Logger::Instance().ClearSinks();
        util::Logger::Instance().SetLevel(util::LogLevel::Info);
        util::Logger::Instance().ClearCategoryLevels();
    }
    
    /// Capture every entry the logger emits
    void Capture() {
        util::Logger::Instance().AddSink(std::make_shared<util::CallbackSink>(
            [this](const util::LogEntry& entry) { captured_.push_back(entry); }));
    }
    
    static std::vector<Byte> Commit(BidAmount amount, const std::string& description,
                                    const Principal& bidder) {
        return ComputeBidCommitment(amount, description, bidder).ToVector();
    }
    
    MemoryAuditSink sink_;
    std::unique_ptr<BidLedger> ledger_;
    std::vector<util::LogEntry> captured_;
};

// ============================================================================
// Event Rendering
// ============================================================================

TEST(AuditEventTest, OperationNames) {
    EXPECT_STREQ(AuditOperationToString(AuditOperation::REGISTER_PROJECT), "register");
    EXPECT_STREQ(AuditOperationToString(AuditOperation::PAUSE), "pause");
    EXPECT_STREQ(AuditOperationToString(AuditOperation::UNPAUSE), "unpause");
    EXPECT_STREQ(AuditOperationToString(AuditOperation::SET_ADMIN), "setadmin");
    EXPECT_STREQ(AuditOperationToString(AuditOperation::SUBMIT_BID), "submit");
    EXPECT_STREQ(AuditOperationToString(AuditOperation::REVEAL_BID), "reveal");
    EXPECT_STREQ(AuditOperationToString(AuditOperation::WITHDRAW_BID), "withdraw");
}

TEST(AuditEventTest, ToString) {
    AuditEvent event;
    event.operation = AuditOperation::WITHDRAW_BID;
    event.projectId = 3;
    event.caller = "alice";
    event.height = 17;
    event.outcome = "withdrawn";
    EXPECT_EQ(event.ToString(), "withdraw project=3 caller=alice height=17 outcome=withdrawn");
    
    event.operation = AuditOperation::PAUSE;
    event.projectId.reset();
    event.outcome = "paused";
    EXPECT_EQ(event.ToString(), "pause caller=alice height=17 outcome=paused");
}

// ============================================================================
// Ledger Events
// ============================================================================

TEST_F(AuditTest, EventPerMutation) {
    ASSERT_TRUE(ledger_->RegisterProject(1));
    ASSERT_EQ(ledger_->SubmitBid("alice", 1, Commit(500, "Roof", "alice")), LedgerResult::Ok());
    ASSERT_TRUE(ledger_->SetHeight(50));
    ASSERT_EQ(ledger_->RevealBid("alice", 1, 500, "Roof", Commit(500, "Roof", "alice")),
              LedgerResult::Ok());
    ASSERT_EQ(ledger_->SubmitBid("bob", 1, Commit(600, "Roof", "bob")), LedgerResult::Ok());
    ASSERT_EQ(ledger_->WithdrawBid("bob", 1), LedgerResult::Ok());
    ASSERT_EQ(ledger_->Pause(DEFAULT_ADMIN), LedgerResult::Ok());
    ASSERT_EQ(ledger_->Unpause(DEFAULT_ADMIN), LedgerResult::Ok());
    ASSERT_EQ(ledger_->SetAdmin(DEFAULT_ADMIN, "council"), LedgerResult::Ok());
    
    std::vector<AuditEvent> events = sink_.GetEvents();
    ASSERT_EQ(events.size(), 8u);
    
    EXPECT_EQ(events[0].operation, AuditOperation::REGISTER_PROJECT);
    EXPECT_EQ(events[0].projectId, std::optional<ProjectId>(1));
    EXPECT_EQ(events[0].caller, "");
    EXPECT_EQ(events[0].height, 42u);
    
    EXPECT_EQ(events[1].operation, AuditOperation::SUBMIT_BID);
    EXPECT_EQ(events[1].caller, "alice");
    EXPECT_EQ(events[1].outcome, "commitment=" + ComputeBidCommitment(500, "Roof", "alice").ToHex());
    
    EXPECT_EQ(events[2].operation, AuditOperation::REVEAL_BID);
    EXPECT_EQ(events[2].height, 50u);
    EXPECT_EQ(events[2].outcome, "amount=500");
    
    EXPECT_EQ(events[3].operation, AuditOperation::SUBMIT_BID);
    EXPECT_EQ(events[4].operation, AuditOperation::WITHDRAW_BID);
    EXPECT_EQ(events[4].caller, "bob");
    EXPECT_EQ(events[4].outcome, "withdrawn");
    
    EXPECT_EQ(events[5].operation, AuditOperation::PAUSE);
    EXPECT_FALSE(events[5].projectId.has_value());
    EXPECT_EQ(events[5].caller, DEFAULT_ADMIN);
    EXPECT_EQ(events[6].operation, AuditOperation::UNPAUSE);
    
    EXPECT_EQ(events[7].operation, AuditOperation::SET_ADMIN);
    EXPECT_EQ(events[7].outcome, "admin=council");
}

TEST_F(AuditTest, NoEventOnRejection) {
    ASSERT_TRUE(ledger_->RegisterProject(1));
    sink_.Clear();
    
    EXPECT_FALSE(ledger_->SubmitBid("alice", 1, std::vector<Byte>(3, 0)));
    EXPECT_FALSE(ledger_->SubmitBid("alice", 9, Commit(1, "", "alice")));
    EXPECT_FALSE(ledger_->RevealBid("alice", 1, 1, "", Commit(1, "", "alice")));
    EXPECT_FALSE(ledger_->WithdrawBid("alice", 1));
    EXPECT_FALSE(ledger_->Pause("mallory"));
    EXPECT_FALSE(ledger_->SetAdmin(DEFAULT_ADMIN, DEFAULT_ADMIN));
    EXPECT_FALSE(ledger_->RegisterProject(1));
    
    EXPECT_EQ(sink_.Count(), 0u);
}

TEST_F(AuditTest, DetachedSink) {
    ledger_->SetAuditSink(nullptr);
    ASSERT_TRUE(ledger_->RegisterProject(1));
    EXPECT_EQ(sink_.Count(), 0u);
}

TEST_F(AuditTest, FailingSinkDoesNotBlockOperation) {
    ThrowingAuditSink failing;
    ledger_->SetAuditSink(&failing);
    Capture();
    
    ASSERT_TRUE(ledger_->RegisterProject(1));
    EXPECT_EQ(ledger_->SubmitBid("alice", 1, Commit(1, "", "alice")), LedgerResult::Ok());
    
    EXPECT_EQ(failing.calls, 2);
    EXPECT_EQ(ledger_->GetBidCount(1), 1u);
    
    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(captured_[1].level, util::LogLevel::Warn);
    EXPECT_EQ(captured_[1].category, util::LogCategory::LEDGER);
    EXPECT_NE(captured_[1].message.find("audit log unavailable"), std::string::npos);
}

// ============================================================================
// Sinks
// ============================================================================

TEST_F(AuditTest, LogAuditSinkWritesAuditCategory) {
    LogAuditSink logSink;
    ledger_->SetAuditSink(&logSink);
    Capture();
    
    ASSERT_TRUE(ledger_->RegisterProject(5));
    
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].level, util::LogLevel::Info);
    EXPECT_EQ(captured_[0].category, util::LogCategory::AUDIT);
    EXPECT_EQ(captured_[0].message, "register project=5 caller= height=42 outcome=registered");
}

TEST_F(AuditTest, LogAuditSinkVisibleUnderQuietGlobalLevel) {
    LogAuditSink logSink;
    ledger_->SetAuditSink(&logSink);
    util::Logger::Instance().SetLevel(util::LogLevel::Warn);
    util::Logger::Instance().SetCategoryLevel(util::LogCategory::AUDIT, util::LogLevel::Info);
    Capture();
    
    ASSERT_TRUE(ledger_->RegisterProject(5));
    
    ASSERT_EQ(captured_.size(), 1u);
    EXPECT_EQ(captured_[0].category, util::LogCategory::AUDIT);
}

TEST_F(AuditTest, LogAuditSinkHonoursCategoryFilter) {
    LogAuditSink logSink;
    ledger_->SetAuditSink(&logSink);
    util::Logger::Instance().EnableCategory(util::LogCategory::LEDGER);
    Capture();
    
    ASSERT_TRUE(ledger_->RegisterProject(5));
    EXPECT_TRUE(captured_.empty());
    
    util::Logger::Instance().EnableAllCategories();
}

TEST(MemoryAuditSinkTest, KeepsOrder) {
    MemoryAuditSink sink;
    AuditEvent a;
    a.operation = AuditOperation::PAUSE;
    AuditEvent b;
    b.operation = AuditOperation::UNPAUSE;
    
    sink.Record(a);
    sink.Record(b);
    ASSERT_EQ(sink.Count(), 2u);
    EXPECT_EQ(sink.GetEvents()[0].operation, AuditOperation::PAUSE);
    EXPECT_EQ(sink.GetEvents()[1].operation, AuditOperation::UNPAUSE);
    
    sink.Clear();
    EXPECT_EQ(sink.Count(), 0u);
}

} // namespace test
} // namespace ledger
} // namespace sealbid
